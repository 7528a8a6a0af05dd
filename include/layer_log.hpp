#ifndef LAYER_LOG_HPP
#define LAYER_LOG_HPP

#include "layer_log/core/log_common.hpp"
#include "layer_log/core/log_level.hpp"
#include "layer_log/core/log_record.hpp"
#include "layer_log/formatter/formatter_interface.hpp"
#include "layer_log/formatter/plain_text_formatter.hpp"
#include "layer_log/formatter/json_formatter.hpp"
#include "layer_log/transport/transport_interface.hpp"
#include "layer_log/transport/stdout_transport.hpp"
#include "layer_log/transport/file_transport.hpp"
#include "layer_log/transport/rolling_file_transport.hpp"
#include "layer_log/transport/callback_transport.hpp"
#include "layer_log/transport/tcp_transport.hpp"
#include "layer_log/backup/backup_store.hpp"
#include "layer_log/sink/sink.hpp"
#include "layer_log/sink/sink_factory.hpp"
#include "layer_log/sink/flush_timer.hpp"
#include "layer_log/router/layer_configuration.hpp"
#include "layer_log/router/layer_router.hpp"
#include "layer_log/dispatch/concurrency_policy.hpp"
#include "layer_log/dispatch/async_dispatcher.hpp"
#include "layer_log/logger/logger_interface.hpp"
#include "layer_log/logger/sync_logger.hpp"
#include "layer_log/logger/async_logger.hpp"
#include "layer_log/logger/composite_logger.hpp"
#include "layer_log/logger/logger_registry.hpp"
#include "layer_log/logger/macros.hpp"
#include "layer_log/config/logger_configuration.hpp"
#include "layer_log/config/environment.hpp"

#endif // LAYER_LOG_HPP
