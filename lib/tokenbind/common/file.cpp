/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdio>
#include <memory>
#include "file.hpp"

namespace tokenbind::file {
    namespace {
        struct file_closer {
            void operator()(FILE *f) const noexcept
            {
                fclose(f);
            }
        };
        using file_ptr = std::unique_ptr<FILE, file_closer>;
    }

    uint8_vector read(const std::string &path)
    {
        const file_ptr f { fopen(path.c_str(), "rb") };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open file for reading: {}", path));
        const auto sz = std::filesystem::file_size(path);
        uint8_vector data(sz);
        if (sz && fread(data.data(), 1, sz, f.get()) != sz) [[unlikely]]
            throw error_sys(fmt::format("failed to read {} bytes from {}", sz, path));
        return data;
    }

    void write(const std::string &path, const buffer data)
    {
        const auto tmp_path = fmt::format("{}.tmp", path);
        {
            const file_ptr f { fopen(tmp_path.c_str(), "wb") };
            if (!f) [[unlikely]]
                throw error_sys(fmt::format("failed to open file for writing: {}", tmp_path));
            if (!data.empty() && fwrite(data.data(), 1, data.size(), f.get()) != data.size()) [[unlikely]]
                throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), tmp_path));
        }
        // the rename makes the new content visible to other processes at once
        std::filesystem::rename(tmp_path, path);
    }

    std::string install_path(const std::string_view rel_path)
    {
        // provide a dummy implementation at the moment
        return fmt::format("./{}", rel_path);
    }

    tmp::tmp(const std::string_view name):
        _path { (std::filesystem::temp_directory_path() / name).string() }
    {
    }

    tmp::~tmp()
    {
        std::error_code ec {};
        std::filesystem::remove(_path, ec);
    }

    tmp_directory::tmp_directory(const std::string_view name):
        _path { std::filesystem::temp_directory_path() / name }
    {
        std::filesystem::remove_all(_path);
        std::filesystem::create_directories(_path);
    }

    tmp_directory::tmp_directory(tmp_directory &&o) noexcept:
        _path { std::move(o._path) }
    {
        o._path.clear();
    }

    tmp_directory::~tmp_directory()
    {
        if (!_path.empty()) {
            std::error_code ec {};
            std::filesystem::remove_all(_path, ec);
        }
    }
}
