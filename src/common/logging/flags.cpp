#include <gflags/gflags.h>

DEFINE_string(log_level, "info", "Minimum log level (trace, debug, info, warn, error, critical, off)");
DEFINE_string(log_file, "fey_engine.log", "Log file path");
DEFINE_int32(log_max_size, 10485760, "Max log file size in bytes before rotation");
DEFINE_int32(log_max_files, 3, "Number of rotated log files to keep");
DEFINE_bool(log_to_stderr, false, "Mirror log output to stderr");

DEFINE_int32(fey_max_restarts, 3, "Performer restarts allowed within the restart window");
DEFINE_int64(fey_restart_window_ms, 60000, "Sliding window for performer restarts in milliseconds");
DEFINE_int32(fey_ensemble_max_restarts, 3, "Ensemble rebuilds allowed within the ensemble restart window");
DEFINE_int64(fey_ensemble_restart_window_ms, 60000, "Sliding window for ensemble rebuilds in milliseconds");
DEFINE_int32(fey_messages_per_resize, 500, "Messages dispatched by an elastic pool between resize checks");
DEFINE_string(fey_jar_repository, "/tmp/fey/jars", "Static repository for performer artifacts");
DEFINE_string(fey_dynamic_jar_repository, "/tmp/fey/jars/dynamic",
              "Repository for performer artifacts with an explicit location");
DEFINE_int32(fey_worker_threads, 0, "Threads on the ordinary worker lane (0 = hardware concurrency)");
DEFINE_int32(fey_control_threads, 1, "Threads on the control-priority lane");
