#include "install/ConfigWriter.hpp"
#include "utils/InstallError.hpp"
#include "utils/Logger.hpp"

#include <yaml-cpp/yaml.h>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace remembrances {

AppConfigValues AppConfigValues::forLayout(const InstallLayout& layout, const std::string& model_name) {
    AppConfigValues values;
    values.knowledge_base = layout.data_dir + "/knowledge-base";
    values.db_path = "surrealkv://" + layout.data_dir + "/remembrances.db";
    values.gguf_model_path = layout.models_dir + "/" + model_name;
    return values;
}

ConfigWriter::ConfigWriter(InstallLayout layout)
    : layout_(std::move(layout)) {
}

std::string ConfigWriter::render(const AppConfigValues& values) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "knowledge-base" << YAML::Value << values.knowledge_base;

    out << YAML::Key << "db-path" << YAML::Value << values.db_path;
    out << YAML::Comment("embedded SurrealDB");
    out << YAML::Key << "surrealdb-user" << YAML::Value << values.surrealdb_user;
    out << YAML::Key << "surrealdb-pass" << YAML::Value << values.surrealdb_pass;
    out << YAML::Key << "surrealdb-namespace" << YAML::Value << values.surrealdb_namespace;
    out << YAML::Key << "surrealdb-database" << YAML::Value << values.surrealdb_database;

    out << YAML::Key << "gguf-model-path" << YAML::Value << values.gguf_model_path;
    out << YAML::Key << "gguf-threads" << YAML::Value << values.gguf_threads;
    out << YAML::Comment("0 = auto-detect");
    out << YAML::Key << "gguf-gpu-layers" << YAML::Value << values.gguf_gpu_layers;
    out << YAML::Comment("0 = CPU only, raise to offload layers to the GPU");

    out << YAML::Key << "chunk-size" << YAML::Value << values.chunk_size;
    out << YAML::Key << "chunk-overlap" << YAML::Value << values.chunk_overlap;

    out << YAML::EndMap;

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::ostringstream ss;
    ss << "# Remembrances-MCP Configuration\n"
       << "# Generated by remembrances-install on "
       << std::put_time(std::localtime(&now), "%Y-%m-%d %H:%M:%S") << "\n"
       << "#\n"
       << "# For all available options, see config.sample.gguf.yaml\n"
       << "# Environment variables use the GOMEM_ prefix (e.g., GOMEM_SSE_ADDR).\n"
       << "# Command-line flags take precedence over YAML, and environment variables over both.\n\n"
       << out.c_str() << "\n";
    return ss.str();
}

std::string ConfigWriter::write(const AppConfigValues& values) {
    std::error_code ec;
    fs::create_directories(values.knowledge_base, ec);
    if (ec) {
        throw InstallError("Cannot create " + values.knowledge_base + ": " + ec.message());
    }
    fs::create_directories(layout_.config_dir, ec);
    if (ec) {
        throw InstallError("Cannot create " + layout_.config_dir + ": " + ec.message());
    }

    std::string config_file = layout_.config_dir + "/config.yaml";
    if (fs::exists(config_file, ec)) {
        LOG_WARN("Configuration file already exists at " + config_file);
        config_file += ".new";
        LOG_WARN("Saving new config as " + config_file);
    }

    LOG_STEP("Creating configuration file...");
    std::ofstream file(config_file);
    if (!file.is_open()) {
        throw InstallError("Failed to open file for writing: " + config_file);
    }
    file << render(values);
    if (!file) {
        throw InstallError("Failed to write " + config_file);
    }

    LOG_SUCCESS("Configuration created at " + config_file);
    return config_file;
}

}
