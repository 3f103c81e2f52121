#pragma once

#include "../onboard/Collaborators.hpp"

#include <filesystem>

namespace netscout::publish
{
    struct ProcessResult
    {
        int exit_code = -1;
        std::string output; // stdout and stderr combined
    };

    // Runs argv[0] from PATH inside `cwd`. Throws std::runtime_error when the
    // process cannot be started.
    ProcessResult RunProcess(const std::vector<std::string> &argv, const std::string &cwd);

    // Writes artifacts under a directory that is (or will be) a git working
    // tree and commits them on request.
    class GitArtifactStore : public onboard::ArtifactStore
    {
    public:
        explicit GitArtifactStore(std::filesystem::path root);

        std::string Write(const std::string &name, const std::string &content) override;
        onboard::CommitOutcome Commit(const std::vector<std::string> &paths, const std::string &message, bool push) override;

        const std::filesystem::path &Root() const { return m_root; }

    private:
        std::filesystem::path m_root;
    };
}
