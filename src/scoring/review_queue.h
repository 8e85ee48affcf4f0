#pragma once

/// @file review_queue.h
/// @brief Human-in-the-loop ledger of flagged inputs
///
/// Items are appended as pending and only ever change status through an
/// explicit operator decision. Nothing is removed or deduplicated. The
/// positional Approve/Reject overwrite any earlier decision so an operator
/// can correct a mistake; the id-based calls only decide pending items.

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>

#include "detection/types.h"
#include "scoring/risk_scorer.h"

namespace agentguard::scoring {

/// @brief Review lifecycle state
enum class ReviewStatus {
    kPending,
    kApproved,   ///< Operator judged it a false positive
    kRejected    ///< Operator confirmed it malicious
};

std::string ReviewStatusToString(ReviewStatus status);

/// @brief One flagged input awaiting or carrying a decision
struct ReviewItem {
    uint64_t id = 0;
    std::string text;
    int score = 0;
    RiskLevel level = RiskLevel::kLow;
    std::vector<detection::Threat> threats;
    std::vector<std::string> reasons;
    std::map<std::string, std::string> metadata;
    ReviewStatus status = ReviewStatus::kPending;
    std::chrono::system_clock::time_point created_at;
};

/// @brief Counts per status; total == pending + approved + rejected
struct ReviewSummary {
    size_t total = 0;
    size_t pending = 0;
    size_t approved = 0;
    size_t rejected = 0;
};

/// @brief Thread-safe, append-only review ledger
class ReviewQueue {
public:
    ReviewQueue() = default;

    ReviewQueue(const ReviewQueue&) = delete;
    ReviewQueue& operator=(const ReviewQueue&) = delete;

    /// @brief Append a pending item built from a score result
    /// @return Stable id of the new item (ids start at 1)
    uint64_t Add(std::string text, const ScoreResult& result,
                 std::map<std::string, std::string> metadata = {});

    /// @brief Pending items in insertion order
    std::vector<ReviewItem> GetPending() const;

    /// @brief The full ledger in insertion order
    std::vector<ReviewItem> Items() const;

    /// @brief Approve the item at a ledger position, replacing any earlier decision
    /// @return false when the index is out of range
    bool Approve(size_t index);

    /// @brief Reject the item at a ledger position, replacing any earlier decision
    /// @return false when the index is out of range
    bool Reject(size_t index);

    /// @brief Approve by stable id
    /// @return NotFound for unknown ids, FailedPrecondition if already decided
    absl::Status ApproveById(uint64_t id);

    /// @brief Reject by stable id
    absl::Status RejectById(uint64_t id);

    ReviewSummary Summary() const;

    size_t Size() const;

private:
    void SetStatusLocked(size_t index, ReviewStatus status);
    absl::Status TransitionById(uint64_t id, ReviewStatus status);
    void PublishPendingLocked() const;

    mutable std::mutex mutex_;
    std::vector<ReviewItem> items_;
    size_t pending_ = 0;
    uint64_t next_id_ = 1;
};

}  // namespace agentguard::scoring
