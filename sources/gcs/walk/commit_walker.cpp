//
// Created by gregorian-rayne on 2/14/26.
//

#include "gcs/walk/commit_walker.hpp"
#include "gcs/log.hpp"

namespace gcs::walk
{
    namespace {

        /**
         * Classifies a failed read. A read that fails once the build was
         * cancelled is reported as the cancellation.
         */
        Error as_corrupt(const Error& error, const CommitId& id, const CancellationToken& cancel) {
            if (error.code() == ErrorCode::Cancelled) {
                return error;
            }
            if (cancel.is_cancelled()) {
                return Error::cancelled();
            }
            return Error::corrupt_history("Cannot read commit: " + error.message(), id);
        }

    }  // namespace

    CommitWalker::CommitWalker(
        git::IRepository& repo,
        CommitId start,
        VisitedSet& visited,
        WalkFilters filters,
        CancellationToken cancel
    )
        : repo_(repo)
        , start_(std::move(start))
        , visited_(visited)
        , filters_(std::move(filters))
        , cancel_(std::move(cancel)) {}

    Result<void, Error> CommitWalker::collect_hidden() {
        std::vector<CommitId> stack(filters_.hidden.begin(), filters_.hidden.end());

        while (!stack.empty()) {
            if (cancel_.is_cancelled()) {
                return Result<void, Error>::failure(Error::cancelled());
            }

            CommitId id = std::move(stack.back());
            stack.pop_back();
            if (!hidden_.insert(id).second) {
                continue;
            }

            auto parents = repo_.parents(id);
            if (parents.is_err()) {
                return Result<void, Error>::failure(as_corrupt(parents.error(), id, cancel_));
            }
            for (auto& parent : parents.value()) {
                if (!hidden_.contains(parent)) {
                    stack.push_back(std::move(parent));
                }
            }
        }
        return Result<void, Error>::success();
    }

    Result<void, Error> CommitWalker::prepare() {
        prepared_ = true;

        if (auto hidden = collect_hidden(); hidden.is_err()) {
            return hidden;
        }

        std::vector<CommitId> stack;
        if (hidden_.contains(start_)) {
            ++stats_.hidden;
        } else {
            stack.push_back(start_);
        }

        while (!stack.empty()) {
            if (cancel_.is_cancelled()) {
                return Result<void, Error>::failure(Error::cancelled());
            }

            CommitId id = std::move(stack.back());
            stack.pop_back();
            if (!visited_.insert(id)) {
                continue;
            }

            auto parents = repo_.parents(id);
            if (parents.is_err()) {
                return Result<void, Error>::failure(as_corrupt(parents.error(), id, cancel_));
            }
            auto meta = repo_.metadata(id);
            if (meta.is_err()) {
                return Result<void, Error>::failure(as_corrupt(meta.error(), id, cancel_));
            }

            Node& node = graph_[id];
            node.record.id = id;
            node.record.parents = std::move(parents).value();
            auto& m = meta.value();
            node.record.author = std::move(m.author);
            node.record.committer = std::move(m.committer);
            node.record.timestamp = m.timestamp;
            node.record.message = std::move(m.message);

            for (const auto& parent : node.record.parents) {
                if (hidden_.contains(parent)) {
                    ++stats_.hidden;
                    continue;
                }
                stack.push_back(parent);
            }
        }

        // Child counts only include edges inside the walk graph.
        for (const auto& [id, node] : graph_) {
            for (const auto& parent : node.record.parents) {
                if (const auto it = graph_.find(parent); it != graph_.end()) {
                    ++it->second.pending_children;
                }
            }
        }

        for (const auto& [id, node] : graph_) {
            if (node.pending_children == 0) {
                push_ready(node);
            }
        }

        stats_.discovered = graph_.size();
        log::debug("Walk discovered " + std::to_string(graph_.size()) + " commit(s) from " + start_);
        return Result<void, Error>::success();
    }

    void CommitWalker::push_ready(const Node& node) {
        ready_.push(ReadyEntry{node.record.timestamp, node.record.id});
    }

    Result<std::optional<CommitRecord>, Error> CommitWalker::next() {
        using NextResult = Result<std::optional<CommitRecord>, Error>;

        if (finished_) {
            return NextResult::success(std::nullopt);
        }
        if (cancel_.is_cancelled()) {
            return NextResult::failure(Error::cancelled());
        }
        if (!prepared_) {
            if (auto prepared = prepare(); prepared.is_err()) {
                finished_ = true;
                return NextResult::failure(prepared.error());
            }
        }

        while (!ready_.empty()) {
            if (cancel_.is_cancelled()) {
                return NextResult::failure(Error::cancelled());
            }

            const ReadyEntry entry = ready_.top();
            ready_.pop();
            ++processed_;

            const auto it = graph_.find(entry.id);
            for (const auto& parent : it->second.record.parents) {
                if (const auto p = graph_.find(parent); p != graph_.end()) {
                    if (--p->second.pending_children == 0) {
                        push_ready(p->second);
                    }
                }
            }

            if (!filters_.in_window(entry.timestamp)) {
                ++stats_.filtered;
                continue;
            }

            ++stats_.emitted;
            return NextResult::success(std::move(it->second.record));
        }

        finished_ = true;
        if (processed_ < graph_.size()) {
            return NextResult::failure(
                Error::corrupt_history(
                    "Commit graph contains a cycle",
                    std::to_string(graph_.size() - processed_) + " commit(s) never became ready"
                )
            );
        }
        return NextResult::success(std::nullopt);
    }

    Result<std::vector<CommitRecord>, Error> collect(CommitWalker& walker) {
        std::vector<CommitRecord> records;
        while (true) {
            auto next = walker.next();
            if (next.is_err()) {
                return Result<std::vector<CommitRecord>, Error>::failure(next.error());
            }
            if (!next.value()) {
                break;
            }
            records.push_back(std::move(*next.value()));
        }
        return Result<std::vector<CommitRecord>, Error>::success(std::move(records));
    }

}  // namespace gcs::walk
