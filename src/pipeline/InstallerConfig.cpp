#include "pipeline/InstallerConfig.hpp"
#include "utils/InstallError.hpp"

#include <yaml-cpp/yaml.h>

namespace remembrances {

namespace {

Override overrideNode(const YAML::Node& node, Override fallback) {
    if (!node) {
        return fallback;
    }
    return parseOverride(node.as<std::string>());
}

}

InstallerConfig InstallerConfig::loadFile(const std::string& path) {
    InstallerConfig cfg;

    try {
        YAML::Node config = YAML::LoadFile(path);

        if (config["app"]) {
            cfg.app_name = config["app"]["name"].as<std::string>(cfg.app_name);
        }

        if (config["release"]) {
            cfg.repository = config["release"]["repository"].as<std::string>(cfg.repository);
            cfg.version = config["release"]["version"].as<std::string>(cfg.version);
        }

        if (config["variant"]) {
            cfg.overrides.nvidia = overrideNode(config["variant"]["nvidia"], cfg.overrides.nvidia);
            cfg.overrides.portable = overrideNode(config["variant"]["portable"], cfg.overrides.portable);
        }

        if (config["cuda"]) {
            cfg.cuda_bundle_url =
                config["cuda"]["runtime_bundle_url"].as<std::string>(cfg.cuda_bundle_url);
            cfg.cuda_lib_dir = config["cuda"]["library_dir"].as<std::string>(cfg.cuda_lib_dir);
            cfg.skip_cuda_libs =
                config["cuda"]["skip_runtime_bundle"].as<bool>(cfg.skip_cuda_libs);
        }

        if (config["model"]) {
            cfg.model_name = config["model"]["name"].as<std::string>(cfg.model_name);
            cfg.model_url = config["model"]["url"].as<std::string>(cfg.model_url);
            cfg.download_model = overrideNode(config["model"]["download"], cfg.download_model);
        }

        if (config["install"]) {
            cfg.install_prefix = config["install"]["prefix"].as<std::string>(cfg.install_prefix);
        }

        if (config["logging"]) {
            cfg.log_level = logLevelFromString(config["logging"]["level"].as<std::string>("info"));
        }
    } catch (const YAML::Exception& e) {
        throw InstallError("Failed to load config " + path + ": " + e.what());
    }

    return cfg;
}

void InstallerConfig::applyEnvironment(SystemProbe& system) {
    if (auto v = system.getEnv("REMEMBRANCES_VERSION"); v && !v->empty()) {
        version = *v;
    }
    if (auto v = system.getEnv("REMEMBRANCES_NVIDIA")) {
        Override o = parseOverride(*v);
        if (o != Override::UNSET) {
            overrides.nvidia = o;
        }
    }
    if (auto v = system.getEnv("REMEMBRANCES_PORTABLE")) {
        Override o = parseOverride(*v);
        if (o != Override::UNSET) {
            overrides.portable = o;
        }
    }
    if (auto v = system.getEnv("REMEMBRANCES_DOWNLOAD_MODEL")) {
        Override o = parseOverride(*v);
        if (o != Override::UNSET) {
            download_model = o;
        }
    }
    if (auto v = system.getEnv("REMEMBRANCES_SKIP_CUDA_LIBS"); v && parseOverride(*v) == Override::YES) {
        skip_cuda_libs = true;
    }
    if (home.empty()) {
        home = system.getEnv("HOME").value_or("");
    }
}

std::string InstallerConfig::resolvedCudaLibDir() const {
    if (!cuda_lib_dir.empty()) {
        return cuda_lib_dir;
    }
    return home + "/.local/lib";
}

}
