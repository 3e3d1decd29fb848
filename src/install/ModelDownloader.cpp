#include "install/ModelDownloader.hpp"
#include "utils/InstallError.hpp"
#include "utils/Logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace remembrances {

ModelDownloader::ModelDownloader(SystemProbePtr system)
    : downloader_(std::move(system)) {
}

bool ModelDownloader::ensure(const ModelSpec& model, const std::string& models_dir) {
    std::string model_path = models_dir + "/" + model.name;

    std::error_code ec;
    if (fs::exists(model_path, ec)) {
        LOG_WARN("GGUF model already exists at " + model_path);
        return true;
    }

    LOG_STEP("Downloading GGUF embedding model (this may take a few minutes)...");
    LOG_WARN("Model size: ~260MB");

    fs::create_directories(models_dir, ec);

    bool ok = false;
    try {
        ok = downloader_.downloadFile(model.url, model_path);
    } catch (const InstallError& e) {
        LOG_WARN(e.what());
    }

    if (ok && fs::exists(model_path, ec)) {
        LOG_SUCCESS("GGUF model downloaded to " + model_path);
        return true;
    }

    // curl -o can leave a partial file behind
    fs::remove(model_path, ec);
    LOG_ERROR("Failed to download GGUF model");
    LOG_WARN("You can download it manually from:");
    LOG_WARN(model.url);
    LOG_WARN("And save it to: " + model_path);
    return false;
}

}
