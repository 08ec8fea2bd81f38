#pragma once

#include <string>
#include <vector>

namespace tman {

struct CronJob {
    size_t index = 0;           // Position among job lines only
    std::string schedule;       // Five fields joined by single spaces, or an @-keyword
    std::string command;
    std::string line;           // As it appears in the crontab
};

// A user crontab as text lines. Job lines can be edited by index; every
// other line (comments, blanks, VAR=value) is kept verbatim.
class Crontab {
public:
    enum class LineKind {
        Blank,
        Comment,
        Environment,
        Job,
        Unknown     // Not recognizable, passed through untouched
    };

    struct Line {
        LineKind kind = LineKind::Blank;
        std::string text;
        std::string schedule;   // Job lines only
        std::string command;    // Job lines only
    };

    static Crontab parse(const std::string& text);

    // Newline-terminated, ready for `crontab -`
    [[nodiscard]] std::string render() const;

    [[nodiscard]] std::vector<CronJob> jobs() const;
    [[nodiscard]] size_t job_count() const;

    void add_job(const std::string& schedule, const std::string& command);
    bool update_job(size_t index, const std::string& schedule, const std::string& command);
    bool remove_job(size_t index);

    // True when only blank lines remain
    [[nodiscard]] bool is_blank() const;

    [[nodiscard]] const std::vector<Line>& lines() const { return lines_; }

    static std::string format_job_line(const std::string& schedule, const std::string& command);

private:
    static Line classify(const std::string& text);
    // Position in lines_ of the index-th job, or lines_.size()
    [[nodiscard]] size_t find_job(size_t index) const;

    std::vector<Line> lines_;
};

// Multi-line description shown when a job is selected
std::string cron_job_details(const CronJob& job);

} // namespace tman
