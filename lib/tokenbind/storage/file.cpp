/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <array>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/sync/file_lock.hpp>
#include <tokenbind/codec/binary.hpp>
#include <tokenbind/common/file.hpp>
#include <tokenbind/common/logger.hpp>
#include "file.hpp"

namespace tokenbind::storage::file {
    namespace journal {
        uint8_vector encode(const batch_t &batch)
        {
            codec::binary::encoder enc {};
            enc.uint_varlen(batch.size());
            for (const auto &[k, v]: batch) {
                enc.process_bytes(k);
                enc.process(v.has_value());
                if (v)
                    enc.process_bytes(*v);
            }
            return enc.bytes();
        }

        batch_t decode(const buffer bytes)
        {
            codec::binary::decoder dec { bytes };
            batch_t batch {};
            const auto num_items = dec.uint_varlen<size_t>();
            for (size_t i = 0; i < num_items; ++i) {
                uint8_vector key {};
                dec.process_bytes(key);
                bool has_value = false;
                dec.process(has_value);
                value_t val {};
                if (has_value)
                    dec.process_bytes(val.emplace());
                batch.insert_or_assign(std::move(key), std::move(val));
            }
            if (!dec.empty()) [[unlikely]]
                throw error(fmt::format("storage::file::journal: {} unexpected trailing bytes", dec.size()));
            return batch;
        }
    }

    namespace {
        // fcntl-based file locks do not exclude threads of the same process and are released
        // when any descriptor of the file is closed. So each process keeps one lock object
        // per db directory and pairs it with a mutex.
        struct dir_lock_t {
            std::mutex mutex {};
            boost::interprocess::file_lock file;

            explicit dir_lock_t(const std::string &path):
                file { path.c_str() }
            {
            }
        };

        std::shared_ptr<dir_lock_t> dir_lock(const std::filesystem::path &lock_path)
        {
            static std::mutex locks_mutex {};
            static std::map<std::string, std::weak_ptr<dir_lock_t>> locks {};
            const auto canon_path = std::filesystem::canonical(lock_path).string();
            std::scoped_lock lk { locks_mutex };
            auto &weak_lock = locks[canon_path];
            if (auto lock = weak_lock.lock())
                return lock;
            try {
                auto lock = std::make_shared<dir_lock_t>(canon_path);
                weak_lock = lock;
                return lock;
            } catch (const boost::interprocess::interprocess_exception &ex) {
                throw error(fmt::format("storage::file::db: unable to open the lock file {}", canon_path), ex);
            }
        }
    }

    /*
     * Stores every value in its own file named after the hex form of the key.
     * Files are spread over 256 subdirectories based on the first byte of the key.
     * A ledger directory holds a few entries per deployed account, so a full
     * directory scan is acceptable for foreach and for size.
     *
     * Batches are first written to a journal file with an atomic rename and only then
     * to the key files. A journal found when the directory is locked belongs to
     * a writer that did not finish and is applied again.
     */
    struct db_t::impl {
        explicit impl(const std::string &dir_path):
            _dir_path { dir_path },
            _journal_path { (_dir_path / journal_name).string() }
        {
            std::filesystem::create_directories(_dir_path);
            const auto lock_path = _dir_path / lock_name;
            if (std::ofstream os { lock_path, std::ios_base::app }; !os) [[unlikely]]
                throw error_sys(fmt::format("storage::file::db: unable to create {}", lock_path.string()));
            _lock = dir_lock(lock_path);
            logger::debug("storage::file::db: opened {}", _dir_path.string());
        }

        void clear()
        {
            for (const auto &e: std::filesystem::directory_iterator(_dir_path)) {
                if (e.is_directory())
                    std::filesystem::remove_all(e.path());
            }
            for (auto &dir: _sub_dirs)
                dir.reset();
        }

        size_t size() const
        {
            return _keys().size();
        }

        void erase(const buffer key)
        {
            std::filesystem::remove(_key_path(key));
        }

        void foreach(const observer_t &obs) const
        {
            for (auto &&key: _keys()) {
                auto val = get(key);
                if (!val) [[unlikely]]
                    throw error(fmt::format("storage::file::db: unable to get data for the key: {}", key));
                obs(key, std::move(*val));
            }
        }

        value_t get(const buffer key) const
        {
            const auto key_path = _key_path(key);
            if (std::filesystem::exists(key_path))
                return tokenbind::file::read(key_path);
            return {};
        }

        void set(const buffer key, const buffer val)
        {
            const auto final_path = _key_path(key);
            logger::trace("storage::file::db: writing {} bytes to {}", val.size(), final_path);
            tokenbind::file::write(final_path, val);
        }

        void apply(const batch_t &batch)
        {
            if (batch.empty())
                return;
            tokenbind::file::write(_journal_path, journal::encode(batch));
            _apply(batch);
            std::filesystem::remove(_journal_path);
            logger::trace("storage::file::db: applied a batch of {} updates to {}", batch.size(), _dir_path.string());
        }

        void lock()
        {
            std::unique_lock mutex_lk { _lock->mutex };
            try {
                _lock->file.lock();
            } catch (const boost::interprocess::interprocess_exception &ex) {
                throw error(fmt::format("storage::file::db: unable to lock {}", _dir_path.string()), ex);
            }
            std::unique_lock file_lk { _lock->file, std::adopt_lock };
            _recover();
            file_lk.release();
            mutex_lk.release();
        }

        void unlock()
        {
            _lock->file.unlock();
            _lock->mutex.unlock();
        }
    private:
        const std::filesystem::path _dir_path;
        const std::string _journal_path;
        std::shared_ptr<dir_lock_t> _lock {};
        mutable std::array<std::optional<std::string>, 256> _sub_dirs {};

        void _apply(const batch_t &batch)
        {
            for (const auto &[k, v]: batch) {
                if (v)
                    set(k, *v);
                else
                    erase(k);
            }
        }

        void _recover()
        {
            if (!std::filesystem::exists(_journal_path))
                return;
            const auto batch = journal::decode(tokenbind::file::read(_journal_path));
            logger::warn("storage::file::db: completing an interrupted batch of {} updates in {}", batch.size(), _dir_path.string());
            _apply(batch);
            std::filesystem::remove(_journal_path);
        }

        // Sorted so that overlays can merge their updates with a single pass.
        std::set<uint8_vector> _keys() const
        {
            std::set<uint8_vector> keys {};
            for (const auto &e: std::filesystem::recursive_directory_iterator(_dir_path)) {
                if (!e.is_regular_file())
                    continue;
                const auto p = e.path();
                // the journal, the lock and the temporary files of interrupted writes
                if (p.extension() != "")
                    continue;
                keys.emplace(uint8_vector::from_hex(p.filename().string()));
            }
            return keys;
        }

        const std::string &_subdir_path(const uint8_t byte0) const
        {
            auto &sub_dir = _sub_dirs[byte0];
            if (!sub_dir) {
                const auto path = _dir_path / fmt::format("{:02X}", byte0);
                sub_dir.emplace(path.string());
                std::filesystem::create_directories(*sub_dir);
            }
            return *sub_dir;
        }

        std::string _key_path(const buffer key) const
        {
            if (key.size() < 2) [[unlikely]]
                throw error("storage::file::db: a key must have at least two bytes!");
            return fmt::format("{}/{}", _subdir_path(key[0]), key);
        }
    };

    db_t::db_t(const std::string &dir_path):
        _impl { std::make_unique<impl>(dir_path) }
    {
    }

    db_t::~db_t() = default;

    void db_t::clear()
    {
        _impl->clear();
    }

    size_t db_t::size() const
    {
        return _impl->size();
    }

    void db_t::erase(const buffer key)
    {
        _impl->erase(key);
    }

    void db_t::foreach(const observer_t &obs) const
    {
        _impl->foreach(obs);
    }

    value_t db_t::get(const buffer key) const
    {
        return _impl->get(key);
    }

    void db_t::set(const buffer key, const buffer val)
    {
        _impl->set(key, val);
    }

    void db_t::apply(const batch_t &batch)
    {
        _impl->apply(batch);
    }

    void db_t::lock()
    {
        _impl->lock();
    }

    void db_t::unlock()
    {
        _impl->unlock();
    }
}
