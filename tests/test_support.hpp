// Shared fixtures for gchat tests.
#pragma once
#include <gchat/ai/llm.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace gchat::testing {

namespace fs = std::filesystem;

// Unique scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = fs::temp_directory_path() / ("gchat_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(m_path);
        m_path = fs::canonical(m_path);
    }
    ~TempDir() { std::error_code ec; fs::remove_all(m_path, ec); }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return m_path; }

    fs::path write(const std::string& rel, const std::string& content) const {
        fs::path p = m_path / rel;
        fs::create_directories(p.parent_path());
        std::ofstream(p, std::ios::binary) << content;
        return p;
    }

private:
    fs::path m_path;
};

// Replays canned replies and records every request.
class ScriptedClient : public ai::ChatClient {
public:
    std::vector<ai::ChatRequest> requests;

    void reply(const std::string& text, bool truncated = false) {
        ai::LLMCompletion c; c.text = text; c.source = "scripted"; c.truncated = truncated;
        c.finish_reason = truncated ? "length" : "stop";
        m_script.push_back(c);
    }
    void fail(const std::string& reason) {
        ai::LLMCompletion c; c.text = reason; c.source = "error";
        m_script.push_back(c);
    }

    std::optional<ai::LLMCompletion> complete(const ai::ChatRequest& request) override {
        requests.push_back(request);
        if (m_script.empty()) return std::nullopt;
        auto c = m_script.front();
        m_script.pop_front();
        return c;
    }

private:
    std::deque<ai::LLMCompletion> m_script;
};

} // namespace gchat::testing
