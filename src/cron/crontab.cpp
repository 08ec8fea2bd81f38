#include "crontab.hpp"
#include "cron_schedule.hpp"
#include "../util.hpp"
#include <cctype>
#include <format>

namespace tman {

namespace {

bool is_identifier(const std::string& name) {
    if (name.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(name[0])) && name[0] != '_') return false;
    for (const char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

// Splits off the first `count` whitespace-separated tokens; the rest is the command
bool split_leading_fields(const std::string& text, const size_t count,
                          std::vector<std::string>& fields, std::string& rest) {
    size_t pos = 0;
    fields.clear();
    while (fields.size() < count) {
        pos = text.find_first_not_of(" \t", pos);
        if (pos == std::string::npos) return false;
        const size_t end = text.find_first_of(" \t", pos);
        fields.push_back(text.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
        if (end == std::string::npos) {
            pos = text.size();
            break;
        }
        pos = end;
    }
    if (fields.size() < count) return false;
    rest = trim(text.substr(pos));
    return !rest.empty();
}

} // namespace

Crontab::Line Crontab::classify(const std::string& text) {
    Line line;
    line.text = text;

    const std::string trimmed = trim(text);
    if (trimmed.empty()) {
        line.kind = LineKind::Blank;
        return line;
    }
    if (trimmed.starts_with('#')) {
        line.kind = LineKind::Comment;
        return line;
    }

    if (const size_t eq = trimmed.find('='); eq != std::string::npos && is_identifier(trim(trimmed.substr(0, eq)))) {
        line.kind = LineKind::Environment;
        return line;
    }

    std::vector<std::string> fields;
    std::string rest;
    const size_t field_count = trimmed.starts_with('@') ? 1 : 5;
    if (split_leading_fields(trimmed, field_count, fields, rest)) {
        line.kind = LineKind::Job;
        line.schedule = join_args(fields);
        line.command = rest;
        return line;
    }

    line.kind = LineKind::Unknown;
    return line;
}

Crontab Crontab::parse(const std::string& text) {
    Crontab crontab;
    for (const auto& raw : split_lines(text)) {
        std::string line = raw;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        crontab.lines_.push_back(classify(line));
    }
    return crontab;
}

std::string Crontab::render() const {
    std::string text;
    for (const auto& line : lines_) {
        text += line.text;
        text += '\n';
    }
    return text;
}

std::string Crontab::format_job_line(const std::string& schedule, const std::string& command) {
    return join_args(split_cron_fields(schedule)) + " " + trim(command);
}

std::vector<CronJob> Crontab::jobs() const {
    std::vector<CronJob> result;
    for (const auto& line : lines_) {
        if (line.kind != LineKind::Job) continue;
        CronJob job;
        job.index = result.size();
        job.schedule = line.schedule;
        job.command = line.command;
        job.line = line.text;
        result.push_back(std::move(job));
    }
    return result;
}

size_t Crontab::job_count() const {
    size_t count = 0;
    for (const auto& line : lines_) {
        if (line.kind == LineKind::Job) ++count;
    }
    return count;
}

size_t Crontab::find_job(const size_t index) const {
    size_t seen = 0;
    for (size_t i = 0; i < lines_.size(); ++i) {
        if (lines_[i].kind != LineKind::Job) continue;
        if (seen++ == index) return i;
    }
    return lines_.size();
}

void Crontab::add_job(const std::string& schedule, const std::string& command) {
    lines_.push_back(classify(format_job_line(schedule, command)));
}

bool Crontab::update_job(const size_t index, const std::string& schedule, const std::string& command) {
    const size_t pos = find_job(index);
    if (pos == lines_.size()) return false;
    lines_[pos] = classify(format_job_line(schedule, command));
    return true;
}

bool Crontab::remove_job(const size_t index) {
    const size_t pos = find_job(index);
    if (pos == lines_.size()) return false;
    lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(pos));
    return true;
}

bool Crontab::is_blank() const {
    for (const auto& line : lines_) {
        if (line.kind != LineKind::Blank) return false;
    }
    return true;
}

std::string cron_job_details(const CronJob& job) {
    std::string text = "Full Command Line:\n" + job.line + "\n\n";
    text += "Schedule: " + job.schedule + "\n";
    text += "Command: " + job.command + "\n";
    text += "Description: " + describe_cron_schedule(job.schedule) + "\n";
    text += "Status: Active\n";

    const auto fields = split_cron_fields(job.schedule);
    if (fields.size() == 5) {
        text += "\nSchedule Breakdown:\n";
        text += std::format("  Minute: {} (0-59)\n", fields[0]);
        text += std::format("  Hour: {} (0-23)\n", fields[1]);
        text += std::format("  Day: {} (1-31)\n", fields[2]);
        text += std::format("  Month: {} (1-12)\n", fields[3]);
        text += std::format("  Weekday: {} (0-7, 0 or 7=Sunday)\n", fields[4]);
    }
    return text;
}

} // namespace tman
