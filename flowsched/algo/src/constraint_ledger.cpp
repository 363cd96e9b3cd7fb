#include <flowsched/algo/constraint_ledger.hpp>
#include <flowsched/algo/error.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <string>
#include <utility>

namespace flowsched::algo {

namespace {

// Cursor over the group text; every failure reports the offending offset.
class GroupParser {
public:
    explicit GroupParser(std::string_view text) : text_(text) {}

    std::vector<ParallelGroup> parse() {
        std::vector<ParallelGroup> groups;
        expect('[');
        do {
            groups.push_back(parse_group());
        } while (accept(','));
        expect(']');
        skip_spaces();
        if (pos_ != text_.size()) {
            fail("trailing characters");
        }
        return groups;
    }

private:
    ParallelGroup parse_group() {
        ParallelGroup group;
        expect('[');
        do {
            group.insert(parse_integer());
        } while (accept(','));
        expect(']');
        return group;
    }

    int64_t parse_integer() {
        skip_spaces();
        int64_t value = 0;
        const char* begin = text_.data() + pos_;
        const char* end = text_.data() + text_.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc{} || ptr == begin) {
            fail("expected an integer task id");
        }
        pos_ += static_cast<std::size_t>(ptr - begin);
        return value;
    }

    bool accept(char c) {
        skip_spaces();
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void expect(char c) {
        if (!accept(c)) {
            fail(std::string("expected '") + c + "'");
        }
    }

    void skip_spaces() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
            ++pos_;
        }
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw MalformedConstraintError("parallel groups \"" + std::string(text_) + "\": " + what +
                                       " at offset " + std::to_string(pos_));
    }

    std::string_view text_;
    std::size_t pos_{0};
};

std::string_view trim(std::string_view text) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

} // anonymous namespace

std::vector<ParallelGroup> parse_parallel_groups(std::string_view text) {
    return GroupParser{text}.parse();
}

uint32_t parse_max_parallel(std::string_view text) {
    std::string_view digits = trim(text);
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) {
        throw MalformedConstraintError("max parallel tasks \"" + std::string(text) +
                                       "\" is not an integer");
    }
    if (value <= 0 || value > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        throw MalformedConstraintError("max parallel tasks must be positive, got " +
                                       std::to_string(value));
    }
    return static_cast<uint32_t>(value);
}

// =============================================================================
// JobConstraints
// =============================================================================

JobConstraints::JobConstraints(core::JobId id, uint32_t max_parallel,
                               std::vector<ParallelGroup> groups)
    : id_(id)
    , max_parallel_(max_parallel)
    , groups_(std::move(groups)) {}

bool JobConstraints::can_run(int64_t index) const {
    if (running_.contains(index) || running_.size() + 1 > max_parallel_) {
        return false;
    }
    return std::any_of(groups_.begin(), groups_.end(), [&](const ParallelGroup& group) {
        return group.contains(index) &&
               std::includes(group.begin(), group.end(), running_.begin(), running_.end());
    });
}

// =============================================================================
// ConstraintLedger
// =============================================================================

void ConstraintLedger::create_job(core::JobId job_id, std::string_view max_parallel_executable_tasks,
                                  std::string_view tasks_which_can_run_in_parallel) {
    uint32_t max_parallel = parse_max_parallel(max_parallel_executable_tasks);
    auto groups = parse_parallel_groups(tasks_which_can_run_in_parallel);
    create_job(job_id, max_parallel, std::move(groups));
}

void ConstraintLedger::create_job(core::JobId job_id, uint32_t max_parallel,
                                  std::vector<ParallelGroup> groups) {
    std::string ctx = "job " + std::to_string(job_id) + ": ";
    if (max_parallel == 0) {
        throw MalformedConstraintError(ctx + "max parallel tasks must be positive");
    }
    if (groups.empty()) {
        throw MalformedConstraintError(ctx + "at least one parallel group is required");
    }
    if (std::any_of(groups.begin(), groups.end(), [](const auto& g) { return g.empty(); })) {
        throw MalformedConstraintError(ctx + "parallel groups must not be empty");
    }
    if (jobs_.contains(job_id)) {
        throw MalformedConstraintError(ctx + "already registered");
    }
    jobs_.emplace(job_id, JobConstraints{job_id, max_parallel, std::move(groups)});
}

bool ConstraintLedger::can_run(core::JobId job_id, int64_t task_index) const {
    return job(job_id).can_run(task_index);
}

void ConstraintLedger::add_running(const core::Task& task) {
    lookup(task.job_id()).add_running(task.index());
}

void ConstraintLedger::remove_running(const core::Task& task) {
    lookup(task.job_id()).remove_running(task.index());
}

const JobConstraints& ConstraintLedger::job(core::JobId job_id) const {
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        throw UnknownJobError(job_id);
    }
    return it->second;
}

JobConstraints& ConstraintLedger::lookup(core::JobId job_id) {
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        throw UnknownJobError(job_id);
    }
    return it->second;
}

} // namespace flowsched::algo
