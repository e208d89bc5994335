#include "fasp_transport.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <functional>
#include <system_error>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "logger.hpp"

namespace
{

/**
 * Run a command and wait for it.
 *
 * @return Exit code (128 + signal number if killed by a signal)
 * @throws TransportError if the process cannot be started or waited for
 */
int runProcess(const std::vector<std::string> &command)
{
    std::vector<char *> argv;
    for (const auto &arg : command)
    {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // Keep buffered log text from being written twice by the child
    std::fflush(stdout);
    std::fflush(stderr);

    pid_t pid = fork();
    if (pid == -1)
    {
        throw TransportError(fmt::format("fork failed: {}", std::strerror(errno)));
    }

    if (pid == 0)
    {
        execvp(argv[0], argv.data());
        // If execvp returns, it failed
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1)
    {
        if (errno != EINTR)
        {
            throw TransportError(fmt::format("waitpid failed: {}", std::strerror(errno)));
        }
    }

    if (WIFEXITED(status))
    {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status))
    {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

/**
 * Replays a completed staging file, then deletes it and calls `onClose`.
 */
class StagedFileHandle : public TransferHandle
{
public:
    StagedFileHandle(std::filesystem::path stagingPath, std::function<void()> onClose)
        : stagingPath_(std::move(stagingPath)), file_(stagingPath_, std::ios::binary), onClose_(std::move(onClose))
    {
        if (!file_)
        {
            throw TransportError(fmt::format("Cannot open staged file {}", stagingPath_.string()));
        }
    }

    ~StagedFileHandle() override
    {
        file_.close();
        std::error_code ec;
        std::filesystem::remove(stagingPath_, ec);
        if (onClose_)
        {
            onClose_();
        }
    }

    std::string readChunk(size_t blockSize) override
    {
        std::string chunk(blockSize, '\0');
        file_.read(&chunk[0], static_cast<std::streamsize>(blockSize));
        if (file_.bad())
        {
            throw TransportError(fmt::format("Read error on staged file {}", stagingPath_.string()));
        }
        chunk.resize(static_cast<size_t>(file_.gcount()));
        return chunk;
    }

    std::uint64_t startOffset() const override { return 0; }

private:
    std::filesystem::path stagingPath_;
    std::ifstream file_;
    std::function<void()> onClose_;
};

} // namespace

FaspTransport::FaspTransport(FaspOptions options, std::filesystem::path stagingDirectory)
    : options_(std::move(options)), stagingDirectory_(std::move(stagingDirectory))
{
}

std::vector<std::string> FaspTransport::buildCommand(const Url &url, const std::filesystem::path &target) const
{
    std::vector<std::string> command = {
        options_.ascpPath,
        "-Q", // adaptive (fair) rate policy
        "-T", // no encryption
        "-l", options_.targetRate,
        "-P", std::to_string(options_.port),
    };

    if (!options_.keyFile.empty())
    {
        command.push_back("-i");
        command.push_back(options_.keyFile);
    }

    std::string source = options_.user.empty()
                             ? fmt::format("{}:{}", url.host, url.path)
                             : fmt::format("{}@{}:{}", options_.user, url.host, url.path);
    command.push_back(source);
    command.push_back(target.string());
    return command;
}

std::unique_ptr<TransferHandle> FaspTransport::open(const Url &url, std::uint64_t resumeOffset)
{
    if (resumeOffset > 0)
    {
        logger::info("FASP cannot resume; {} will be transferred whole", url.text);
    }

    std::filesystem::create_directories(stagingDirectory_);
    std::filesystem::path target = stagingDirectory_ / (url.basename() + ".fasp");

    std::error_code ec;
    std::filesystem::remove(target, ec);

    auto command = buildCommand(url, target);
    logger::debug("Running {}", fmt::join(command, " "));

    int exitCode = runProcess(command);
    if (exitCode != 0)
    {
        std::filesystem::remove(target, ec);
        throw TransportError(fmt::format("{}: ascp exited with status {}", url.text, exitCode));
    }

    if (!std::filesystem::exists(target))
    {
        throw TransportError(fmt::format("{}: ascp reported success but wrote nothing", url.text));
    }

    // The staged size is answerable for as long as the handle is open
    std::string key = url.text;
    auto handle = std::make_unique<StagedFileHandle>(target, [this, key]
                                                     { staged_.erase(key); });
    staged_[key] = target;
    return handle;
}

std::uint64_t FaspTransport::size(const Url &url)
{
    auto it = staged_.find(url.text);
    if (it == staged_.end())
    {
        throw TransportError(fmt::format("{}: size is only known after the transfer", url.text));
    }

    std::error_code ec;
    auto bytes = std::filesystem::file_size(it->second, ec);
    if (ec)
    {
        throw TransportError(fmt::format("{}: {}", it->second.string(), ec.message()));
    }
    return static_cast<std::uint64_t>(bytes);
}
