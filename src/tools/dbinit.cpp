#include "../storage/sqlite.hpp"

#include <filesystem>
#include <iostream>
#include <string>

using namespace blobdex;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <sqlite_file>" << std::endl;
    std::cout << "Creates the index tables in an SQLite file." << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --help                Show this help message" << std::endl;
    std::cout << "  --wipe                    Delete an existing file and re-create it" << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    bool wipe = false;
    std::string db_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--wipe") {
            wipe = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else if (db_path.empty()) {
            db_path = arg;
        } else {
            std::cerr << "Error: Multiple database paths given" << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (db_path.empty()) {
        std::cerr << "Error: Database path is required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    std::error_code ec;
    if (std::filesystem::exists(db_path, ec) && std::filesystem::file_size(db_path, ec) > 0) {
        if (!wipe) {
            std::cerr << "Database " << db_path << " already exists, but --wipe not given. Stopping."
                      << std::endl;
            return 1;
        }
        for (const std::string& suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(db_path + suffix, ec);
            if (ec) {
                std::cerr << "Error removing " << db_path << suffix << ": " << ec.message() << std::endl;
                return 1;
            }
        }
        std::cout << "Wiped " << db_path << std::endl;
    }

    try {
        SQLiteKeyValue::init_db(db_path);
    } catch (const KeyValueError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Initialized " << db_path << " (schema version " << SQLITE_SCHEMA_VERSION << ")"
              << std::endl;
    return 0;
}
