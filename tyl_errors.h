#ifndef TYL_ERRORS_H
#define TYL_ERRORS_H

// Error classification and retry policy library.
//
//   tyl::TylError error = tyl::TylError::network("Connection timeout");
//   if (error.category().is_retriable()) {
//       auto delay = error.category().retry_delay(1);
//       ...
//   }

#include "data_logger.h"
#include "error_settings.h"
#include "error_category.h"
#include "error_context.h"
#include "tyl_error.h"
#include "retry_policy.h"
#include "error_handler.h"

#endif // TYL_ERRORS_H
