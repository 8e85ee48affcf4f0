#include "scoring/review_queue.h"

#include <utility>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"

namespace agentguard::scoring {

std::string ReviewStatusToString(ReviewStatus status) {
    switch (status) {
        case ReviewStatus::kPending: return "pending";
        case ReviewStatus::kApproved: return "approved";
        case ReviewStatus::kRejected: return "rejected";
    }
    return "pending";
}

uint64_t ReviewQueue::Add(std::string text, const ScoreResult& result,
                          std::map<std::string, std::string> metadata) {
    std::lock_guard<std::mutex> lock(mutex_);

    ReviewItem item;
    item.id = next_id_++;
    item.text = std::move(text);
    item.score = result.score;
    item.level = result.level;
    item.threats = result.threats;
    item.reasons = result.reasons;
    item.metadata = std::move(metadata);
    item.status = ReviewStatus::kPending;
    item.created_at = std::chrono::system_clock::now();

    const uint64_t id = item.id;
    items_.push_back(std::move(item));
    ++pending_;

    AGENTGUARD_COUNTER(metric_names::kReviewEnqueued).Increment();
    PublishPendingLocked();
    AGENTGUARD_LOG_DEBUG("Queued item {} for review (score {}, {})", id, result.score,
                         RiskLevelToString(result.level));
    return id;
}

std::vector<ReviewItem> ReviewQueue::GetPending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ReviewItem> pending;
    for (const auto& item : items_) {
        if (item.status == ReviewStatus::kPending) {
            pending.push_back(item);
        }
    }
    return pending;
}

std::vector<ReviewItem> ReviewQueue::Items() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_;
}

bool ReviewQueue::Approve(size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= items_.size()) {
        return false;
    }
    SetStatusLocked(index, ReviewStatus::kApproved);
    return true;
}

bool ReviewQueue::Reject(size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= items_.size()) {
        return false;
    }
    SetStatusLocked(index, ReviewStatus::kRejected);
    return true;
}

absl::Status ReviewQueue::ApproveById(uint64_t id) {
    return TransitionById(id, ReviewStatus::kApproved);
}

absl::Status ReviewQueue::RejectById(uint64_t id) {
    return TransitionById(id, ReviewStatus::kRejected);
}

ReviewSummary ReviewQueue::Summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ReviewSummary summary;
    summary.total = items_.size();
    summary.pending = pending_;
    for (const auto& item : items_) {
        if (item.status == ReviewStatus::kApproved) {
            ++summary.approved;
        } else if (item.status == ReviewStatus::kRejected) {
            ++summary.rejected;
        }
    }
    return summary;
}

size_t ReviewQueue::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

void ReviewQueue::SetStatusLocked(size_t index, ReviewStatus status) {
    auto& item = items_[index];
    if (item.status == ReviewStatus::kPending && status != ReviewStatus::kPending) {
        --pending_;
    }
    item.status = status;
    PublishPendingLocked();
    AGENTGUARD_LOG_INFO("Review item {} {}", item.id, ReviewStatusToString(status));
}

absl::Status ReviewQueue::TransitionById(uint64_t id, ReviewStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Ids are assigned sequentially and items are never removed.
    if (id == 0 || id >= next_id_) {
        return NotFoundError(absl::StrCat("Review item not found: ", id));
    }
    const size_t index = static_cast<size_t>(id - 1);
    if (items_[index].status != ReviewStatus::kPending) {
        return MakeError(ErrorCode::kFailedPrecondition,
                         absl::StrCat("Review item ", id, " is already ",
                                      ReviewStatusToString(items_[index].status)));
    }
    SetStatusLocked(index, status);
    return OkStatus();
}

void ReviewQueue::PublishPendingLocked() const {
    AGENTGUARD_GAUGE(metric_names::kReviewPending).Set(static_cast<double>(pending_));
}

}  // namespace agentguard::scoring
