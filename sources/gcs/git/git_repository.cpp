//
// Created by gregorian-rayne on 2/12/26.
//

#include "gcs/git/git_repository.hpp"
#include "gcs/utils/string_utils.hpp"
#include "gcs/utils/time_utils.hpp"
#include "gcs/log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace gcs::git
{
    namespace {

        constexpr std::size_t kShowFieldCount = 9;

        bool is_hex_id(const std::string_view s) {
            return s.size() >= 7 && std::ranges::all_of(s, [](const unsigned char c) {
                return std::isxdigit(c) != 0;
            });
        }

        std::optional<std::uint64_t> parse_count(const std::string_view s) {
            std::uint64_t value = 0;
            if (s.empty()) {
                return std::nullopt;
            }
            if (const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
                ec != std::errc{} || ptr != s.data() + s.size()) {
                return std::nullopt;
            }
            return value;
        }

        std::optional<Timestamp> parse_epoch(const std::string_view s) {
            std::int64_t seconds = 0;
            const auto trimmed = string_utils::trim(s);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            if (const auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), seconds);
                ec != std::errc{} || ptr != trimmed.data() + trimmed.size()) {
                return std::nullopt;
            }
            return time_utils::from_epoch_seconds(seconds);
        }

    }  // namespace

    // =============================================================================
    // Output parsing
    // =============================================================================

    const std::string& commit_show_format() {
        static const std::string format =
            "--format=%H%x00%P%x00%an%x00%ae%x00%at%x00%cn%x00%ce%x00%ct%x00%B";
        return format;
    }

    Result<ParsedCommit, Error> parse_commit_show(const std::string_view output) {
        // The message is last and may not contain NUL, so split at most
        // kShowFieldCount - 1 times.
        std::vector<std::string_view> fields;
        std::size_t start = 0;
        while (fields.size() + 1 < kShowFieldCount) {
            const auto pos = output.find('\0', start);
            if (pos == std::string_view::npos) {
                break;
            }
            fields.push_back(output.substr(start, pos - start));
            start = pos + 1;
        }
        if (fields.size() + 1 != kShowFieldCount) {
            return Result<ParsedCommit, Error>::failure(
                Error::corrupt_history("Unexpected commit format",
                                       "expected " + std::to_string(kShowFieldCount) + " fields")
            );
        }
        fields.push_back(output.substr(start));

        ParsedCommit commit;
        commit.id = std::string(string_utils::trim(fields[0]));
        if (!is_hex_id(commit.id)) {
            return Result<ParsedCommit, Error>::failure(
                Error::corrupt_history("Malformed commit id", std::string(fields[0]))
            );
        }

        for (const auto parent : string_utils::split(string_utils::trim(fields[1]), ' ')) {
            if (parent.empty()) {
                continue;
            }
            if (!is_hex_id(parent)) {
                return Result<ParsedCommit, Error>::failure(
                    Error::corrupt_history("Malformed parent id", commit.id)
                );
            }
            commit.parents.emplace_back(parent);
        }

        const auto author_time = parse_epoch(fields[4]);
        const auto commit_time = parse_epoch(fields[7]);
        if (!author_time || !commit_time) {
            return Result<ParsedCommit, Error>::failure(
                Error::corrupt_history("Malformed commit timestamp", commit.id)
            );
        }

        auto& meta = commit.metadata;
        meta.author = Signature{std::string(fields[2]), std::string(fields[3])};
        meta.committer = Signature{std::string(fields[5]), std::string(fields[6])};
        meta.timestamp = *author_time;
        meta.commit_time = *commit_time;
        meta.message = std::string(string_utils::trim_right(fields[8]));

        return Result<ParsedCommit, Error>::success(std::move(commit));
    }

    Result<std::vector<FileChange>, Error> parse_numstat(const std::string_view output) {
        std::vector<FileChange> changes;

        for (auto record : string_utils::split(output, '\0')) {
            // Without --no-commit-id the first record starts with "<id>\n".
            if (const auto nl = record.find('\n'); nl != std::string_view::npos && nl < record.find('\t') &&
                is_hex_id(string_utils::trim(record.substr(0, nl)))) {
                record.remove_prefix(nl + 1);
            }
            const auto trimmed = string_utils::trim(record);
            if (trimmed.empty()) {
                continue;
            }

            const auto first_tab = record.find('\t');
            if (first_tab == std::string_view::npos) {
                if (is_hex_id(trimmed)) {
                    continue;
                }
                return Result<std::vector<FileChange>, Error>::failure(
                    Error::corrupt_history("Malformed numstat record", std::string(record))
                );
            }
            const auto second_tab = record.find('\t', first_tab + 1);
            if (second_tab == std::string_view::npos) {
                return Result<std::vector<FileChange>, Error>::failure(
                    Error::corrupt_history("Malformed numstat record", std::string(record))
                );
            }

            const auto added = string_utils::trim(record.substr(0, first_tab));
            const auto removed = record.substr(first_tab + 1, second_tab - first_tab - 1);
            const auto path = record.substr(second_tab + 1);

            FileChange change;
            change.path = std::string(path);
            if (change.path.empty()) {
                return Result<std::vector<FileChange>, Error>::failure(
                    Error::corrupt_history("Numstat record without path", std::string(record))
                );
            }

            if (added == "-" && removed == "-") {
                change.binary = true;
            } else {
                const auto ins = parse_count(added);
                const auto del = parse_count(removed);
                if (!ins || !del) {
                    return Result<std::vector<FileChange>, Error>::failure(
                        Error::corrupt_history("Malformed numstat counts", std::string(record))
                    );
                }
                change.insertions = *ins;
                change.deletions = *del;
            }
            changes.push_back(std::move(change));
        }

        return Result<std::vector<FileChange>, Error>::success(std::move(changes));
    }

    // =============================================================================
    // GitRepository
    // =============================================================================

    GitRepository::GitRepository(PrivateKey, fs::path root, const Duration timeout)
        : root_(std::move(root))
        , timeout_(timeout) {}

    Result<std::shared_ptr<GitRepository>, Error> GitRepository::open(
        const fs::path& path,
        const Duration timeout
    ) {
        std::error_code ec;
        if (!fs::is_directory(path, ec)) {
            return Result<std::shared_ptr<GitRepository>, Error>::failure(
                Error::repository_not_found("Repository path does not exist", path.string())
            );
        }

        auto git_dir = execute_git({"rev-parse", "--git-dir"}, path, timeout);
        if (git_dir.is_err()) {
            return Result<std::shared_ptr<GitRepository>, Error>::failure(
                git_dir.error().with_code(ErrorCode::RepositoryNotFound)
            );
        }
        if (!git_dir.value().succeeded()) {
            return Result<std::shared_ptr<GitRepository>, Error>::failure(
                Error::repository_not_found(
                    "Not a git repository",
                    path.string() + ": " + std::string(string_utils::trim(git_dir.value().stderr_output))
                )
            );
        }

        fs::path root = fs::absolute(path, ec);
        if (ec) {
            root = path;
        }

        log::debug("Opened repository " + root.string());
        return Result<std::shared_ptr<GitRepository>, Error>::success(
            std::make_shared<GitRepository>(PrivateKey{}, std::move(root), timeout)
        );
    }

    Result<CommitId, Error> GitRepository::resolve_start(const std::string& ref) {
        if (ref.empty() || ref.front() == '-') {
            return Result<CommitId, Error>::failure(
                Error::not_found("Unknown reference", ref)
            );
        }

        auto result = execute_git(
            {"rev-parse", "--verify", "--quiet", ref + "^{commit}"},
            root_,
            timeout_
        );
        if (result.is_err()) {
            return Result<CommitId, Error>::failure(result.error());
        }
        if (!result.value().succeeded()) {
            return Result<CommitId, Error>::failure(
                Error::not_found("Unknown reference", ref)
            );
        }

        const std::string id(string_utils::trim(result.value().stdout_output));
        if (!is_hex_id(id)) {
            return Result<CommitId, Error>::failure(
                Error::corrupt_history("Unexpected rev-parse output", id)
            );
        }
        return Result<CommitId, Error>::success(id);
    }

    Result<ParsedCommit, Error> GitRepository::lookup(const CommitId& id) {
        {
            std::lock_guard lock(cache_mutex_);
            if (const auto it = cache_.find(id); it != cache_.end()) {
                return Result<ParsedCommit, Error>::success(it->second);
            }
        }

        if (!is_hex_id(id)) {
            return Result<ParsedCommit, Error>::failure(Error::not_found("Unknown commit", id));
        }

        auto result = execute_git(
            {"show", "-s", "--no-show-signature", commit_show_format(), id},
            root_,
            timeout_
        );
        if (result.is_err()) {
            return Result<ParsedCommit, Error>::failure(result.error());
        }
        if (!result.value().succeeded()) {
            return Result<ParsedCommit, Error>::failure(
                Error::not_found("Unknown commit", id)
            );
        }

        auto parsed = parse_commit_show(result.value().stdout_output);
        if (parsed.is_err()) {
            return Result<ParsedCommit, Error>::failure(parsed.error().with_context(id));
        }

        std::lock_guard lock(cache_mutex_);
        const auto [it, inserted] = cache_.emplace(id, std::move(parsed).value());
        return Result<ParsedCommit, Error>::success(it->second);
    }

    Result<std::vector<CommitId>, Error> GitRepository::parents(const CommitId& id) {
        return lookup(id).map([](const ParsedCommit& commit) {
            return commit.parents;
        });
    }

    Result<CommitMetadata, Error> GitRepository::metadata(const CommitId& id) {
        return lookup(id).map([](const ParsedCommit& commit) {
            return commit.metadata;
        });
    }

    Result<std::vector<FileChange>, Error> GitRepository::diff_against_parent(
        const CommitId& id,
        const std::size_t parent_index
    ) {
        auto commit = lookup(id);
        if (commit.is_err()) {
            return Result<std::vector<FileChange>, Error>::failure(
                commit.error().with_code(ErrorCode::DiffUnavailable)
            );
        }

        const auto& parents = commit.value().parents;
        std::vector<std::string> args = {"diff-tree", "-r", "--numstat", "-z", "--no-renames", "--no-commit-id"};
        if (parents.empty()) {
            args.emplace_back("--root");
            args.push_back(id);
        } else if (parent_index < parents.size()) {
            args.push_back(parents[parent_index]);
            args.push_back(id);
        } else {
            return Result<std::vector<FileChange>, Error>::failure(
                Error::invalid_argument(
                    "Parent index out of range",
                    id + " has " + std::to_string(parents.size()) + " parent(s)"
                )
            );
        }

        auto result = execute_git(args, root_, timeout_);
        if (result.is_err()) {
            return Result<std::vector<FileChange>, Error>::failure(
                result.error().with_code(ErrorCode::DiffUnavailable).with_context(id)
            );
        }
        if (!result.value().succeeded()) {
            return Result<std::vector<FileChange>, Error>::failure(
                Error::diff_unavailable(
                    "git diff-tree failed for " + id,
                    std::string(string_utils::trim(result.value().stderr_output))
                )
            );
        }

        auto changes = parse_numstat(result.value().stdout_output);
        if (changes.is_err()) {
            return Result<std::vector<FileChange>, Error>::failure(
                changes.error().with_code(ErrorCode::DiffUnavailable).with_context(id)
            );
        }
        return changes;
    }

    std::string GitRepository::describe() const {
        return root_.string();
    }

    Result<RepositoryPtr, Error> open_repository(const fs::path& path) {
        auto repo = GitRepository::open(path);
        if (repo.is_err()) {
            return Result<RepositoryPtr, Error>::failure(repo.error());
        }
        return Result<RepositoryPtr, Error>::success(std::move(repo).value());
    }

}  // namespace gcs::git
