#include "dbfs_master/config.hpp"
#include <iostream>
#include <stdexcept>

using dbfs_common::Status;

namespace dbfs_master {

namespace {

Status ParseBool(const std::string& flag, const std::string& value, bool& out) {
    if (value == "true" || value == "1") {
        out = true;
    } else if (value == "false" || value == "0") {
        out = false;
    } else {
        return Status::Invalid(flag + " expects true or false, got '" + value + "'");
    }
    return Status::OK();
}

Status ParseUnsigned(const std::string& flag, const std::string& value, uint64_t& out) {
    try {
        size_t consumed = 0;
        if (value.empty() || value[0] == '-') {
            throw std::invalid_argument("negative");
        }
        out = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception&) {
        return Status::Invalid(flag + " expects a non-negative integer, got '" + value + "'");
    }
    return Status::OK();
}

}  // namespace

const char* RecordBackendName(RecordBackend backend) {
    return backend == RecordBackend::kMemory ? "memory" : "journal";
}

Status ParseArgs(int argc, char* argv[], FsConfig& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            continue;
        }

        bool takes_value = arg == "--host" || arg == "--port" || arg == "--data-dir" ||
                           arg == "--records" || arg == "--sync" ||
                           arg == "--cache-enable" || arg == "--cache-bytes" ||
                           arg == "--compact-threshold" || arg == "--system-owner" ||
                           arg == "--admin-token";
        if (!takes_value) {
            std::cerr << "ParseArgs: Ignoring unknown flag: " << arg << std::endl;
            continue;
        }
        if (i + 1 >= argc) {
            return Status::Invalid(arg + " requires a value");
        }
        std::string value = argv[++i];

        Status parsed;
        if (arg == "--host") {
            config.host = value;
        } else if (arg == "--port") {
            uint64_t port = 0;
            parsed = ParseUnsigned(arg, value, port);
            if (parsed.ok() && (port == 0 || port > 65535)) {
                parsed = Status::Invalid("--port out of range: " + value);
            }
            config.port = static_cast<int>(port);
        } else if (arg == "--data-dir") {
            config.data_dir = value;
        } else if (arg == "--records") {
            if (value == "memory") {
                config.records = RecordBackend::kMemory;
            } else if (value == "journal") {
                config.records = RecordBackend::kJournal;
            } else {
                parsed = Status::Invalid("--records expects memory or journal, got '" +
                                         value + "'");
            }
        } else if (arg == "--sync") {
            parsed = ParseBool(arg, value, config.sync);
        } else if (arg == "--cache-enable") {
            parsed = ParseBool(arg, value, config.cache_enabled);
        } else if (arg == "--cache-bytes") {
            parsed = ParseUnsigned(arg, value, config.cache_bytes);
        } else if (arg == "--compact-threshold") {
            parsed = ParseUnsigned(arg, value, config.compact_threshold);
        } else if (arg == "--system-owner") {
            if (value.empty()) {
                parsed = Status::Invalid("--system-owner must not be empty");
            }
            config.system_owner = value;
        } else if (arg == "--admin-token") {
            config.admin_token = value;
        }

        if (!parsed.ok()) {
            return parsed;
        }
    }
    return Status::OK();
}

void PrintUsage(std::ostream& out) {
    out << "Usage: dbfs_master [options]" << std::endl
        << "Options:" << std::endl
        << "  --host <addr>               Listen address (default: 0.0.0.0)" << std::endl
        << "  --port <port>               Listen port (default: 50060)" << std::endl
        << "  --data-dir <path>           Records and objects directory (default: ./dbfs_data)"
        << std::endl
        << "  --records <memory|journal>  Record store backend (default: journal)" << std::endl
        << "  --sync <true|false>         fsync every commit (default: true)" << std::endl
        << "  --cache-enable <true|false> Cache recently read objects (default: true)"
        << std::endl
        << "  --cache-bytes <N>           Cache capacity in bytes (default: 67108864)"
        << std::endl
        << "  --compact-threshold <N>     Journal batches between compactions (default: 1024)"
        << std::endl
        << "  --system-owner <handle>     Owner of system-created nodes (default: public)"
        << std::endl
        << "  --admin-token <token>       Enables system-only RPCs (default: disabled)"
        << std::endl
        << "  --help                      Show this help message" << std::endl;
}

}  // namespace dbfs_master
