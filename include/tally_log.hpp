#ifndef TALLY_LOG_HPP
#define TALLY_LOG_HPP

#include "tally_log/core/errors.hpp"
#include "tally_log/core/log_common.hpp"
#include "tally_log/core/log_entry.hpp"
#include "tally_log/core/log_level.hpp"
#include "tally_log/core/file_format.hpp"
#include "tally_log/core/persistence_policy.hpp"
#include "tally_log/config/default_paths.hpp"
#include "tally_log/formatter/formatter_interface.hpp"
#include "tally_log/formatter/console_formatter.hpp"
#include "tally_log/formatter/csv_formatter.hpp"
#include "tally_log/formatter/json_formatter.hpp"
#include "tally_log/transport/transport_interface.hpp"
#include "tally_log/transport/file_transport.hpp"
#include "tally_log/transport/stdout_transport.hpp"
#include "tally_log/sink/sink_interface.hpp"
#include "tally_log/sink/callback_sink.hpp"
#include "tally_log/sink/color_console_sink.hpp"
#include "tally_log/sink/level_file_sink.hpp"
#include "tally_log/sink/csv_file_sink.hpp"
#include "tally_log/sink/json_file_sink.hpp"
#include "tally_log/log_manager.hpp"

#endif // TALLY_LOG_HPP
