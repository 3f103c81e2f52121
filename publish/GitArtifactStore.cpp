#include "GitArtifactStore.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <sys/wait.h>
#include <unistd.h>

namespace netscout::publish
{
    ProcessResult RunProcess(const std::vector<std::string> &argv, const std::string &cwd)
    {
        if (argv.empty())
            throw std::invalid_argument("empty command line");

        int out_pipe[2] = {-1, -1};
        if (pipe(out_pipe) != 0)
            throw std::runtime_error("failed to create pipe: " + std::string(strerror(errno)));

        pid_t pid = fork();
        if (pid < 0)
        {
            close(out_pipe[0]);
            close(out_pipe[1]);
            throw std::runtime_error("failed to fork: " + std::string(strerror(errno)));
        }

        if (pid == 0)
        {
            close(out_pipe[0]);
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(out_pipe[1], STDERR_FILENO);
            close(out_pipe[1]);

            if (!cwd.empty() && chdir(cwd.c_str()) != 0)
                _exit(126);

            std::vector<const char *> args;
            for (const auto &arg : argv)
                args.push_back(arg.c_str());
            args.push_back(nullptr);

            execvp(args[0], const_cast<char *const *>(args.data()));
            _exit(127);
        }

        close(out_pipe[1]);

        ProcessResult result;
        char buf[1024];
        for (;;)
        {
            ssize_t n = read(out_pipe[0], buf, sizeof(buf));
            if (n > 0)
            {
                result.output.append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR)
                continue;
            break;
        }
        close(out_pipe[0]);

        int status = 0;
        while (waitpid(pid, &status, 0) < 0)
        {
            if (errno != EINTR)
                throw std::runtime_error("waitpid failed: " + std::string(strerror(errno)));
        }

        result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        return result;
    }

    namespace
    {
        std::string FirstLine(const std::string &text)
        {
            size_t start = text.find_first_not_of("\r\n");
            if (start == std::string::npos)
                return "";
            size_t end = text.find('\n', start);
            return text.substr(start, end == std::string::npos ? std::string::npos : end - start);
        }

        std::string Describe(const std::string &step, const ProcessResult &result)
        {
            std::string line = FirstLine(result.output);
            if (result.exit_code == 127)
                line = "git executable not found";
            return step + " failed (exit " + std::to_string(result.exit_code) + ")" + (line.empty() ? "" : ": " + line);
        }
    }

    GitArtifactStore::GitArtifactStore(std::filesystem::path root) : m_root(std::move(root)) {}

    std::string GitArtifactStore::Write(const std::string &name, const std::string &content)
    {
        if (name.empty() || name.find('/') != std::string::npos || name.find("..") != std::string::npos)
            throw std::invalid_argument("invalid artifact name '" + name + "'");

        std::error_code ec;
        std::filesystem::create_directories(m_root, ec);
        if (ec)
            throw std::runtime_error("cannot create " + m_root.string() + ": " + ec.message());

        std::filesystem::path target = m_root / name;
        std::filesystem::path staging = m_root / ("." + name + ".tmp");
        {
            std::ofstream out(staging, std::ios::binary | std::ios::trunc);
            if (!out)
                throw std::runtime_error("cannot open " + staging.string() + " for writing");
            out << content;
            out.flush();
            if (!out)
                throw std::runtime_error("write to " + staging.string() + " failed");
        }

        std::filesystem::rename(staging, target, ec);
        if (ec)
        {
            std::filesystem::remove(staging, ec);
            throw std::runtime_error("cannot move artifact into " + target.string());
        }

        std::cout << "[Artifacts] Wrote " << target.string() << " (" << content.size() << " bytes)" << std::endl;
        return target.string();
    }

    onboard::CommitOutcome GitArtifactStore::Commit(const std::vector<std::string> &paths, const std::string &message, bool push)
    {
        onboard::CommitOutcome outcome;
        const std::string cwd = m_root.string();

        auto fail = [&outcome](std::string error)
        {
            std::cerr << "[Artifacts] " << error << std::endl;
            outcome.error = std::move(error);
            return outcome;
        };

        try
        {
            if (!std::filesystem::exists(m_root / ".git"))
                return fail(cwd + " is not a git working tree");

            std::vector<std::string> add = {"git", "add", "--"};
            for (const auto &path : paths)
                add.push_back(std::filesystem::path(path).lexically_relative(m_root).string());

            ProcessResult result = RunProcess(add, cwd);
            if (result.exit_code != 0)
                return fail(Describe("git add", result));

            result = RunProcess({"git", "commit", "-m", message}, cwd);
            if (result.exit_code != 0)
                return fail(Describe("git commit", result));
            outcome.committed = true;
            std::cout << "[Artifacts] Committed " << paths.size() << " file(s): " << message << std::endl;

            if (!push)
                return outcome;

            result = RunProcess({"git", "push"}, cwd);
            if (result.exit_code != 0)
                return fail(Describe("git push", result));
            outcome.pushed = true;
            std::cout << "[Artifacts] Pushed " << cwd << std::endl;
        }
        catch (const std::exception &e)
        {
            return fail(e.what());
        }

        return outcome;
    }
}
