#pragma once

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include <unistd.h>

#include "event_sink.hpp"

namespace fs = std::filesystem;

// In-memory sink; safe to read from a thread other than the one syncing.
class RecordingEventSink : public mirrord::EventSink {
public:
    void change(const mirrord::ChangeEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        changes_.push_back(event);
    }

    void entry_failed(const mirrord::EntryError& error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_.push_back(error);
    }

    void pass_completed(const mirrord::PassSummary& summary) override {
        std::lock_guard<std::mutex> lock(mutex_);
        summaries_.push_back(summary);
        ++passes_completed;
    }

    void pass_aborted(const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        aborts_.push_back(reason);
    }

    void inconsistency_detected(const mirrord::Inconsistency& inconsistency) override {
        std::lock_guard<std::mutex> lock(mutex_);
        inconsistencies_.push_back(inconsistency);
    }

    void consistency_checked(const mirrord::ConsistencySummary&) override {
        ++consistency_checks;
    }

    std::vector<mirrord::ChangeEvent> changes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return changes_;
    }
    std::vector<mirrord::EntryError> errors() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return errors_;
    }
    std::vector<mirrord::PassSummary> summaries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return summaries_;
    }
    std::vector<std::string> aborts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return aborts_;
    }
    std::vector<mirrord::Inconsistency> inconsistencies() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return inconsistencies_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        changes_.clear();
        errors_.clear();
        summaries_.clear();
        aborts_.clear();
        inconsistencies_.clear();
    }

    std::atomic<int> passes_completed{0};
    std::atomic<int> consistency_checks{0};

private:
    mutable std::mutex mutex_;
    std::vector<mirrord::ChangeEvent> changes_;
    std::vector<mirrord::EntryError> errors_;
    std::vector<mirrord::PassSummary> summaries_;
    std::vector<std::string> aborts_;
    std::vector<mirrord::Inconsistency> inconsistencies_;
};

// Fresh source/ and destination/ directories under the system temp dir.
class TempTreeTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path source;
    fs::path destination;

    void SetUp() override {
        std::random_device rd;
        test_dir = fs::temp_directory_path() /
                   ("mirrord_test_" + std::to_string(::getpid()) + "_" + std::to_string(rd()));
        source = test_dir / "source";
        destination = test_dir / "destination";
        fs::create_directories(source);
        fs::create_directories(destination);
    }

    void TearDown() override {
        std::error_code ec;
        // Restore permissions a test may have taken away so cleanup succeeds
        for (auto it = fs::recursive_directory_iterator(test_dir, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_directory(ec) && !it->is_symlink(ec)) {
                fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
            }
        }
        fs::remove_all(test_dir, ec);
    }

    static void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    // A fixed point well in the past, so tests never race the clock.
    static fs::file_time_type base_time() {
        static const auto t = fs::file_time_type::clock::now() - std::chrono::hours(24);
        return t;
    }

    static void set_mtime(const fs::path& path, fs::file_time_type time) {
        fs::last_write_time(path, time);
    }

    // Relative paths of every file and directory under root, with a trailing
    // slash on directories, sorted.
    static std::vector<std::string> listing(const fs::path& root) {
        std::vector<std::string> entries;
        for (const auto& entry : fs::recursive_directory_iterator(root)) {
            auto relative = fs::relative(entry.path(), root).generic_string();
            if (entry.is_directory()) relative += "/";
            entries.push_back(relative);
        }
        std::sort(entries.begin(), entries.end());
        return entries;
    }

    static bool running_as_root() { return ::geteuid() == 0; }
};
