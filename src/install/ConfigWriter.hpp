#pragma once

#include "install/InstallLayout.hpp"
#include <string>

namespace remembrances {

struct AppConfigValues {
    std::string knowledge_base;
    std::string db_path;
    std::string gguf_model_path;
    std::string surrealdb_user = "root";
    std::string surrealdb_pass = "root";
    std::string surrealdb_namespace = "test";
    std::string surrealdb_database = "test";
    int gguf_threads = 0;       // 0 = auto-detect
    int gguf_gpu_layers = 0;    // 0 = CPU only
    int chunk_size = 1500;
    int chunk_overlap = 200;

    static AppConfigValues forLayout(const InstallLayout& layout, const std::string& model_name);
};

// Writes the application's config.yaml.
class ConfigWriter {
public:
    explicit ConfigWriter(InstallLayout layout);

    static std::string render(const AppConfigValues& values);

    // Creates the knowledge-base directory and writes config.yaml. An
    // existing config.yaml is kept; the new one goes to config.yaml.new.
    // Returns the path written. Throws InstallError on I/O failure.
    std::string write(const AppConfigValues& values);

private:
    InstallLayout layout_;
};

}
