#pragma once

#include <chartsmith/tooling.hpp>
#include <string>

namespace chartsmith {

struct TarSettings {
    std::string binary = "tar";
    int timeout_seconds = 120;
};

// gzip-compressed tarballs through the tar binary
class TarCodec : public ArchiveCodec {
public:
    explicit TarCodec(TarSettings settings = {}) : settings_(std::move(settings)) {}

    Status extract(const std::filesystem::path& archive,
                   const std::filesystem::path& dest_dir) override;

private:
    TarSettings settings_;
};

} // namespace chartsmith
