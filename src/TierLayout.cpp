#include "TierLayout.hpp"

#include <stdexcept>
#include <system_error>

namespace {
bool isRegularFile(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && !ec;
}
}

std::string toString(Tier tier) {
    switch (tier) {
    case Tier::Cache:
        return "cache";
    case Tier::Array:
        return "array";
    }
    throw std::logic_error("Unknown destination tier " + std::to_string(static_cast<int>(tier)));
}

TierLayout::TierLayout(std::string realSource, std::string cacheDir, std::string arraySource)
    : m_realSource(std::move(realSource)), m_cacheDir(std::move(cacheDir)), m_arraySource(std::move(arraySource)) {
    if (m_arraySource.empty()) {
        m_arraySource = m_realSource;
    }
}

bool TierLayout::contains(const std::string& identityPath) const {
    return !m_realSource.empty() && identityPath.size() > m_realSource.size() &&
           identityPath.compare(0, m_realSource.size(), m_realSource) == 0;
}

std::string TierLayout::relativePart(const std::string& identityPath) const {
    if (!contains(identityPath)) {
        throw std::invalid_argument("Path `" + identityPath + "` is not under `" + m_realSource + "`");
    }
    return identityPath.substr(m_realSource.size());
}

std::filesystem::path TierLayout::cachePathFor(const std::string& identityPath) const {
    return std::filesystem::path(m_cacheDir + relativePart(identityPath));
}

std::filesystem::path TierLayout::arrayPathFor(const std::string& identityPath) const {
    return std::filesystem::path(m_arraySource + relativePart(identityPath));
}

std::filesystem::path TierLayout::sourcePathFor(const std::string& identityPath, Tier destination) const {
    switch (destination) {
    case Tier::Cache:
        return arrayPathFor(identityPath);
    case Tier::Array:
        return cachePathFor(identityPath);
    }
    throw std::logic_error("Unknown destination tier " + std::to_string(static_cast<int>(destination)));
}

std::filesystem::path TierLayout::destinationPathFor(const std::string& identityPath, Tier destination) const {
    switch (destination) {
    case Tier::Cache:
        return cachePathFor(identityPath);
    case Tier::Array:
        return arrayPathFor(identityPath);
    }
    throw std::logic_error("Unknown destination tier " + std::to_string(static_cast<int>(destination)));
}

std::filesystem::path TierLayout::rootOf(Tier tier) const {
    switch (tier) {
    case Tier::Cache:
        return std::filesystem::path(m_cacheDir);
    case Tier::Array:
        return std::filesystem::path(m_arraySource);
    }
    throw std::logic_error("Unknown destination tier " + std::to_string(static_cast<int>(tier)));
}

TierHint TierLayout::locate(const std::string& identityPath) const {
    if (!contains(identityPath)) {
        return TierHint::Unknown;
    }

    const bool onCache = isRegularFile(cachePathFor(identityPath));
    const bool onArray = isRegularFile(arrayPathFor(identityPath));
    if (onCache && onArray) {
        return TierHint::Both;
    }
    if (onCache) {
        return TierHint::Cache;
    }
    if (onArray) {
        return TierHint::Array;
    }
    return TierHint::Unknown;
}
