#pragma once

#include "install/Downloader.hpp"
#include <string>

namespace remembrances {

struct ModelSpec {
    std::string name;
    std::string url;
};

// Fetches the GGUF embedding model. Failures are warnings, never fatal.
class ModelDownloader {
public:
    explicit ModelDownloader(SystemProbePtr system);

    // Returns true if the model is present afterwards.
    bool ensure(const ModelSpec& model, const std::string& models_dir);

private:
    Downloader downloader_;
};

}
