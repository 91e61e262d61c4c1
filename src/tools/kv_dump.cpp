#include "../storage/registry.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

using namespace blobdex;

static void print_escaped(const std::string& s) {
    for (unsigned char c : s) {
        if (c >= 0x20 && c < 0x7f && c != '\\') {
            std::cout << c;
        } else {
            char buf[8];
            snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned int>(c));
            std::cout << buf;
        }
    }
}

int main(int argc, char** argv) {
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: " << argv[0] << " <config.json> [key_prefix]\n";
        return 1;
    }

    std::ifstream in(argv[1]);
    if (!in) {
        std::cerr << "Config file not found: " << argv[1] << "\n";
        return 1;
    }
    nlohmann::json cfg = nlohmann::json::parse(in, nullptr, false);
    if (cfg.is_discarded()) {
        std::cerr << "Config file " << argv[1] << " is not valid JSON\n";
        return 1;
    }
    std::string prefix = argc == 3 ? argv[2] : "";

    auto registry = new_default_registry();
    std::unique_ptr<KeyValue> kv;
    try {
        kv = registry->create(cfg);
    } catch (const std::runtime_error& e) {
        std::cerr << "Failed to open store: " << e.what() << "\n";
        return 1;
    }

    size_t count = 0;
    auto it = query_prefix(*kv, prefix);
    while (it->next()) {
        print_escaped(it->key());
        std::cout << " = ";
        print_escaped(it->value());
        std::cout << "\n";
        count++;
    }
    try {
        it->close();
        kv->close();
    } catch (const KeyValueError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nTotal records: " << count << "\n";
    return 0;
}
