#include <sessionvault/config.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <sessionvault/version.hpp>

namespace sessionvault {

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options] <command> [args...]\n"
            << "\nOptions:\n"
            << "  --config, -c <path>       Path to YAML config file\n"
            << "  --db-path <path>          Database path (required)\n"
            << "  --log-level <level>       trace, debug, info, warn, error, critical, off\n"
            << "  --cache-bytes <n>         Record cache budget in bytes\n"
            << "  --cache-ttl-ms <n>        Record cache entry lifetime (0 = none)\n"
            << "  --queue-max-size <n>      Waiting writes before low items are shed\n"
            << "  --sync-writes             Sync the WAL on every write\n"
            << "  --version                 Print the library version\n"
            << "  --help, -h                Show this help\n"
            << "\nExamples:\n"
            << "  " << argv0 << " --db-path /data/sessions stats\n"
            << "  " << argv0 << " --config /etc/sessionvault.yaml gc\n";
}

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

uint64_t ParseUint(const std::string& name, const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::runtime_error("Invalid value for " + name + ": " + value);
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw std::runtime_error("Value out of range for " + name + ": " + value);
  }
}

int ParseInt(const std::string& name, const std::string& value) {
  uint64_t v = ParseUint(name, value);
  if (v > 1000000000ull) {
    throw std::runtime_error("Value out of range for " + name + ": " + value);
  }
  return static_cast<int>(v);
}

bool ParseBool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

const char* NextArg(int argc, char** argv, int* i, const std::string& flag,
                    const char* what) {
  if (++*i >= argc) {
    throw std::runtime_error(flag + " requires " + what);
  }
  return argv[*i];
}

}  // namespace

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;

  while (std::getline(file, line)) {
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      throw std::runtime_error("Malformed line in " + path + ": " + line);
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    const std::string name = current_section.empty() ? key : current_section + "." + key;

    if (current_section == "cache") {
      if (key == "max_size_bytes") {
        config.cache.max_size_bytes = ParseUint(name, value);
      } else if (key == "max_items") {
        config.cache.max_items = ParseUint(name, value);
      } else if (key == "ttl_ms") {
        config.cache.ttl_ms = ParseUint(name, value);
      }
    } else if (current_section == "queue") {
      if (key == "max_size") {
        config.queue.max_size = ParseUint(name, value);
      } else if (key == "normal_interval_ms") {
        config.queue.normal_interval_ms = ParseUint(name, value);
      } else if (key == "low_idle_interval_ms") {
        config.queue.low_idle_interval_ms = ParseUint(name, value);
      } else if (key == "low_batch_size") {
        config.queue.low_batch_size = ParseUint(name, value);
      } else if (key == "retry_base_delay_ms") {
        config.queue.retry_base_delay_ms = ParseUint(name, value);
      } else if (key == "max_retries_critical") {
        config.queue.max_retries_critical = ParseInt(name, value);
      } else if (key == "max_retries_normal") {
        config.queue.max_retries_normal = ParseInt(name, value);
      } else if (key == "max_retries_low") {
        config.queue.max_retries_low = ParseInt(name, value);
      }
    } else if (current_section == "content") {
      if (key == "block_cache_bytes") {
        config.content.block_cache_bytes = ParseUint(name, value);
      } else if (key == "lock_timeout_ms") {
        config.content.lock_timeout_ms = ParseInt(name, value);
      } else if (key == "max_txn_retries") {
        config.content.max_txn_retries = ParseInt(name, value);
      } else if (key == "metadata_cache_bytes") {
        config.content.metadata_cache_bytes = ParseUint(name, value);
      } else if (key == "gc_progress_interval") {
        config.content.gc_progress_interval = ParseUint(name, value);
      } else if (key == "sync_writes") {
        config.content.sync_writes = ParseBool(value);
      }
    } else if (current_section == "compression") {
      if (key == "age_threshold_days") {
        config.compression.age_threshold_days = static_cast<uint32_t>(ParseInt(name, value));
      } else if (key == "max_cpu_percent") {
        config.compression.max_cpu_percent = static_cast<uint32_t>(ParseInt(name, value));
      }
    } else if (current_section.empty()) {
      // Top-level keys
      if (key == "db_path") {
        config.db_path = value;
      } else if (key == "log_level") {
        config.log_level = value;
      }
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  // The file (if any) is the base; flags are applied on top of it.
  std::string config_file;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      config_file = NextArg(argc, argv, &i, arg, "a path argument");
    }
  }

  Config config;
  if (!config_file.empty()) {
    config = LoadFromFile(config_file);
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << "sessionvault " << Version() << "\n";
      std::exit(0);
    } else if (arg == "--config" || arg == "-c") {
      ++i;
    } else if (arg == "--db-path") {
      config.db_path = NextArg(argc, argv, &i, arg, "a path");
    } else if (arg == "--log-level") {
      config.log_level = NextArg(argc, argv, &i, arg, "a level");
    } else if (arg == "--cache-bytes") {
      config.cache.max_size_bytes = ParseUint(arg, NextArg(argc, argv, &i, arg, "a number"));
    } else if (arg == "--cache-ttl-ms") {
      config.cache.ttl_ms = ParseUint(arg, NextArg(argc, argv, &i, arg, "a number"));
    } else if (arg == "--queue-max-size") {
      config.queue.max_size = ParseUint(arg, NextArg(argc, argv, &i, arg, "a number"));
    } else if (arg == "--sync-writes") {
      config.content.sync_writes = true;
    } else if (!arg.empty() && arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    } else {
      config.args.push_back(arg);
    }
  }

  return config;
}

void Config::Validate() const {
  if (db_path.empty()) {
    throw std::runtime_error("db_path is required (use --db-path or config file)");
  }

  if (log_level != "trace" && log_level != "debug" && log_level != "info" &&
      log_level != "warn" && log_level != "error" && log_level != "critical" &&
      log_level != "off") {
    throw std::runtime_error("Invalid log_level: " + log_level +
                             " (must be trace, debug, info, warn, error, critical, or off)");
  }

  if (cache.max_size_bytes == 0) {
    throw std::runtime_error("cache.max_size_bytes must be positive");
  }
  if (queue.max_size == 0) {
    throw std::runtime_error("queue.max_size must be positive");
  }
  if (queue.low_batch_size == 0) {
    throw std::runtime_error("queue.low_batch_size must be positive");
  }
  if (queue.max_retries_critical < 0 || queue.max_retries_normal < 0 ||
      queue.max_retries_low < 0) {
    throw std::runtime_error("queue.max_retries_* must not be negative");
  }
  if (content.lock_timeout_ms <= 0) {
    throw std::runtime_error("content.lock_timeout_ms must be positive");
  }
  if (content.gc_progress_interval == 0) {
    throw std::runtime_error("content.gc_progress_interval must be positive");
  }
  if (compression.max_cpu_percent == 0 || compression.max_cpu_percent > 100) {
    throw std::runtime_error("compression.max_cpu_percent must be in 1..100");
  }
}

EngineOptions Config::ToEngineOptions() const {
  EngineOptions opt;

  opt.database.block_cache_bytes = static_cast<size_t>(content.block_cache_bytes);
  opt.database.sync_writes = content.sync_writes;

  opt.content.lock_timeout_ms = content.lock_timeout_ms;
  opt.content.max_retries = content.max_txn_retries;
  opt.content.metadata_cache_bytes = content.metadata_cache_bytes;
  opt.content.gc_progress_interval = content.gc_progress_interval;

  opt.queue.max_size = queue.max_size;
  opt.queue.normal_interval_ms = queue.normal_interval_ms;
  opt.queue.low_idle_interval_ms = queue.low_idle_interval_ms;
  opt.queue.low_batch_size = queue.low_batch_size;
  opt.queue.retry_base_delay_ms = queue.retry_base_delay_ms;
  opt.queue.max_retries_critical = queue.max_retries_critical;
  opt.queue.max_retries_normal = queue.max_retries_normal;
  opt.queue.max_retries_low = queue.max_retries_low;

  opt.records.cache.max_size_bytes = cache.max_size_bytes;
  opt.records.cache.max_items = cache.max_items;
  opt.records.cache.ttl_ms = cache.ttl_ms;

  return opt;
}

}  // namespace sessionvault
