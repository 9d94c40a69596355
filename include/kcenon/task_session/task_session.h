/**
 * @file task_session.h
 * @brief Main include for the task session library
 *
 * @code
 * #include <kcenon/task_session/task_session.h>
 *
 * using namespace kcenon::task_session;
 *
 * auto manager = task_manager::builder().build();
 * @endcode
 */

#ifndef KCENON_TASK_SESSION_TASK_SESSION_H
#define KCENON_TASK_SESSION_TASK_SESSION_H

#include "kcenon/task_session/config/feature_flags.h"

#include "kcenon/task_session/core/callback_executor.h"
#include "kcenon/task_session/core/download_relocator.h"
#include "kcenon/task_session/core/logging.h"
#include "kcenon/task_session/core/request.h"
#include "kcenon/task_session/core/resume_data.h"
#include "kcenon/task_session/core/types.h"

#include "kcenon/task_session/adapters/thread_pool_adapter.h"

#include "kcenon/task_session/operation/data_task_operation.h"
#include "kcenon/task_session/operation/download_task_operation.h"
#include "kcenon/task_session/operation/operation.h"
#include "kcenon/task_session/operation/operation_queue.h"
#include "kcenon/task_session/operation/task_operation.h"
#include "kcenon/task_session/operation/upload_task_operation.h"

#include "kcenon/task_session/transport/http_transport_session.h"
#include "kcenon/task_session/transport/session_configuration.h"
#include "kcenon/task_session/transport/transport_events.h"
#include "kcenon/task_session/transport/transport_session.h"

#include "kcenon/task_session/session/manager_config.h"
#include "kcenon/task_session/session/session_context.h"
#include "kcenon/task_session/session/session_router.h"
#include "kcenon/task_session/session/task_manager.h"
#include "kcenon/task_session/session/task_registry.h"

#include <string>

namespace kcenon::task_session {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_TASK_SESSION_H
