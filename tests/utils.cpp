#include "tests/testing_utils.hpp"

#include "kiln/parser.hpp"

#include <chrono>
#include <cstdio>
#include <fcntl.h>
#include <iostream>
#include <format>
#include <fstream>
#include <sstream>
#include <unistd.h>

void create_file(const std::string &name, const std::string &content) {
    auto parent = std::filesystem::path(name).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent);
    std::ofstream f(name);
    f << content;
    f.close();
}

void create_dummy_file(const std::string &name) {
    create_file(name, "module dummy; endmodule\n");
}

std::string read_file(const std::string &name) {
    std::ifstream f(name);
    std::ostringstream content;
    content << f.rdbuf();
    return content.str();
}

std::vector<std::string> read_lines(const std::string &name) {
    std::ifstream f(name);
    std::vector<std::string> lines;
    for (std::string line; std::getline(f, line);) {
        if (!line.empty())
            lines.push_back(line);
    }
    return lines;
}

void set_mtime(const std::filesystem::path &path, int offset_seconds) {
    std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() +
                                               std::chrono::seconds(offset_seconds));
}

ScratchDir::ScratchDir(std::string_view name) {
    previous_ = std::filesystem::current_path();
    dir_ = std::filesystem::temp_directory_path() / std::format("kiln_{}_{}", name, getpid());
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
    std::filesystem::current_path(dir_);
}

ScratchDir::~ScratchDir() {
    std::error_code ec;
    std::filesystem::current_path(previous_, ec);
    std::filesystem::remove_all(dir_, ec);
}

CapturedStdout::CapturedStdout() {
    file_ = std::filesystem::temp_directory_path() / std::format("kiln_stdout_{}", getpid());
    std::cout.flush();
    std::fflush(stdout);
    saved_fd_ = dup(STDOUT_FILENO);
    int fd = open(file_.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    dup2(fd, STDOUT_FILENO);
    close(fd);
}

CapturedStdout::~CapturedStdout() {
    finish();
}

std::string CapturedStdout::finish() {
    if (saved_fd_ == -1)
        return {};
    std::cout.flush();
    std::fflush(stdout);
    dup2(saved_fd_, STDOUT_FILENO);
    close(saved_fd_);
    saved_fd_ = -1;

    std::string content = read_file(file_.string());
    std::error_code ec;
    std::filesystem::remove(file_, ec);
    return content;
}

kiln::Result<std::unique_ptr<Project>> load_project(const std::string &manifest, const kiln::ExecutorConfig &config,
                                                    kiln::ResolverContext context) {
    create_file("kiln.build", manifest);
    if (context.build_file.empty())
        context.build_file = "kiln.build";

    auto project = std::make_unique<Project>();
    project->builder = kiln::KilnBuilder(std::move(context));
    if (auto res = kiln::parse(project->builder, "kiln.build"); !res)
        return std::unexpected(res.error());

    project->resolver =
        std::make_unique<kiln::VariableResolver>(project->builder.definitions(), project->builder.context());
    auto graph = project->builder.emit_graph(*project->resolver);
    if (!graph)
        return std::unexpected(graph.error());
    project->executor = std::make_unique<kiln::Executor>(std::move(*graph), *project->resolver, config);
    return project;
}

const kiln::ExecutionResult *find_result(const std::vector<kiln::ExecutionResult> &results, std::string_view target) {
    for (const auto &result : results) {
        if (result.target == target)
            return &result;
    }
    return nullptr;
}
