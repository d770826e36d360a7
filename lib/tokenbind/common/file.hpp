#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <filesystem>
#include <string>
#include <string_view>
#include "bytes.hpp"

namespace tokenbind::file {
    extern uint8_vector read(const std::string &path);
    extern void write(const std::string &path, buffer data);
    extern std::string install_path(std::string_view rel_path);

    // A temporary file path that is removed when the object goes out of scope.
    struct tmp {
        explicit tmp(const std::string_view name);
        ~tmp();
        tmp(const tmp &) =delete;

        [[nodiscard]] const std::string &path() const noexcept
        {
            return _path;
        }

        operator const std::string &() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };

    // Creates an empty temporary directory and removes it with all its contents on destruction.
    struct tmp_directory {
        explicit tmp_directory(const std::string_view name);
        ~tmp_directory();
        tmp_directory(const tmp_directory &) =delete;
        tmp_directory(tmp_directory &&o) noexcept;

        [[nodiscard]] const std::filesystem::path &path() const noexcept
        {
            return _path;
        }

        explicit operator std::filesystem::path() const noexcept
        {
            return _path;
        }
    private:
        std::filesystem::path _path;
    };
}
