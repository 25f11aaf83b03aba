// filename: discovery.cpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#include "oceanparse/discovery.hpp"

#include <algorithm>
#include <system_error>

namespace oceanparse {
namespace {

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::vector<std::filesystem::path> findFiles(const std::filesystem::path& directory,
                                             const std::string& prefix,
                                             const std::string& suffix) {
    namespace fs = std::filesystem;
    std::vector<fs::path> files;

    std::error_code ec;
    fs::directory_iterator it(directory.empty() ? fs::path(".") : directory, ec);
    if (ec) {
        return files;
    }
    const fs::directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code statusEc;
        if (!it->is_regular_file(statusEc)) {
            continue;
        }
        const std::string name = it->path().filename().string();
        if (!startsWith(name, prefix)) {
            continue;
        }
        if (!suffix.empty() && !endsWith(name, suffix)) {
            continue;
        }
        files.push_back(it->path());
    }

    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return files;
}

std::string fileRoleName(FileRole role) {
    switch (role) {
        case FileRole::Photon:
            return "photon";
        case FileRole::Lanczos:
            return "lanczos";
        case FileRole::Spectra:
        default:
            return "spectra";
    }
}

const std::string& NamingConvention::prefix(FileRole role) const {
    switch (role) {
        case FileRole::Photon:
            return photonPrefix;
        case FileRole::Lanczos:
            return lanczosPrefix;
        case FileRole::Spectra:
        default:
            return spectraPrefix;
    }
}

std::string NamingConvention::suffix(FileRole role, const std::string& key) const {
    std::size_t length = 0;
    switch (role) {
        case FileRole::Photon:
            length = photonSuffixLength;
            break;
        case FileRole::Lanczos:
            length = lanczosSuffixLength;
            break;
        case FileRole::Spectra:
        default:
            return key;
    }
    if (length >= key.size()) {
        return key;
    }
    return key.substr(key.size() - length);
}

std::vector<std::string> discoverPolarizationKeys(const std::filesystem::path& directory,
                                                  const NamingConvention& convention) {
    std::vector<std::string> keys;
    for (const auto& path : findFiles(directory, convention.spectraPrefix)) {
        keys.push_back(path.filename().string());
    }
    return keys;
}

std::vector<std::filesystem::path> discover(const std::filesystem::path& directory, FileRole role,
                                            const std::string& key,
                                            const NamingConvention& convention) {
    if (role == FileRole::Spectra) {
        // The key is the spectra file name itself.
        std::vector<std::filesystem::path> files;
        if (!startsWith(key, convention.spectraPrefix)) {
            return files;
        }
        const std::filesystem::path base = directory.empty() ? std::filesystem::path(".") : directory;
        const std::filesystem::path path = base / key;
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) {
            files.push_back(path);
        }
        return files;
    }
    return findFiles(directory, convention.prefix(role), convention.suffix(role, key));
}

}  // namespace oceanparse
