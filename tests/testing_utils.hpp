#pragma once

#include "kiln/builder.hpp"
#include "kiln/executor.hpp"
#include "kiln/resolver.hpp"
#include "kiln/utility.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

void create_file(const std::string &name, const std::string &content);
void create_dummy_file(const std::string &name);
std::string read_file(const std::string &name);

// Moves a file's modification time to now + offset_seconds.
void set_mtime(const std::filesystem::path &path, int offset_seconds);

// Fresh directory under the system temp dir, used as the working directory
// for its lifetime.
class ScratchDir {
public:
    explicit ScratchDir(std::string_view name);
    ~ScratchDir();

    ScratchDir(const ScratchDir &) = delete;
    ScratchDir &operator=(const ScratchDir &) = delete;

    const std::filesystem::path &path() const {
        return dir_;
    }

private:
    std::filesystem::path dir_;
    std::filesystem::path previous_;
};

// Redirects file descriptor 1 into a temporary file until finish().
class CapturedStdout {
public:
    CapturedStdout();
    ~CapturedStdout();

    CapturedStdout(const CapturedStdout &) = delete;
    CapturedStdout &operator=(const CapturedStdout &) = delete;

    std::string finish();

private:
    std::filesystem::path file_;
    int saved_fd_ = -1;
};

// One invocation's worth of state: definitions, resolver and executor.
struct Project {
    kiln::KilnBuilder builder;
    std::unique_ptr<kiln::VariableResolver> resolver;
    std::unique_ptr<kiln::Executor> executor;
};

// Writes `manifest` to kiln.build in the working directory and loads it.
kiln::Result<std::unique_ptr<Project>> load_project(const std::string &manifest,
                                                    const kiln::ExecutorConfig &config = {},
                                                    kiln::ResolverContext context = {});

const kiln::ExecutionResult *find_result(const std::vector<kiln::ExecutionResult> &results, std::string_view target);
std::vector<std::string> read_lines(const std::string &name);
