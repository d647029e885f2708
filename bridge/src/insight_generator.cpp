/**
 * insight_generator.cpp — Implementation
 */

#include "insight_generator.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <optional>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <glog/logging.h>
#include <json/json.h>

namespace therapy_lens {

InsightRequest make_insight_request(const SessionReport& report,
                                    const Baselines& baselines,
                                    const AlertLog& alerts,
                                    size_t max_alerts) {
    InsightRequest request;
    request.duration_sec = report.duration_sec;
    request.avg_eye_contact_pct = report.eye_contact.avg;
    request.avg_gaze_stability_pct = report.gaze_stability.avg;
    request.avg_breathing_bpm = report.breathing.avg;
    request.baselines = baselines;
    request.dominant_emotion = report.dominant_emotion;
    request.recent_alerts = alerts.recent_messages(max_alerts);
    return request;
}

std::string insight_request_to_json(const InsightRequest& request) {
    Json::Value root(Json::objectValue);
    root["duration_sec"] = static_cast<Json::Int64>(request.duration_sec);
    root["duration_min"] = static_cast<Json::Int64>(request.duration_sec / 60);
    root["avg_eye_contact_pct"] = request.avg_eye_contact_pct;
    root["avg_gaze_stability_pct"] = request.avg_gaze_stability_pct;
    root["avg_breathing_bpm"] = request.avg_breathing_bpm;
    root["baseline_breathing_bpm"] = request.baselines.baseline_breathing_bpm;
    root["baseline_eye_contact_pct"] = request.baselines.baseline_eye_contact_pct;
    root["dominant_emotion"] = request.dominant_emotion;

    Json::Value recent(Json::arrayValue);
    for (const auto& message : request.recent_alerts) {
        recent.append(message);
    }
    root["recent_alerts"] = recent;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

namespace {

// Deletes the request file however generate() returns
class ScopedTempFile {
public:
    explicit ScopedTempFile(std::string path) : path_(std::move(path)) {}
    ~ScopedTempFile() { ::unlink(path_.c_str()); }

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

int remaining_ms(absl::Time deadline) {
    const absl::Duration left = deadline - absl::Now();
    if (left <= absl::ZeroDuration()) return 0;
    return static_cast<int>(absl::ToInt64Milliseconds(absl::Ceil(left, absl::Milliseconds(1))));
}

// Kill the whole process group so shells do not leave children behind
void kill_and_reap(pid_t pid) {
    ::kill(-pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

// Wait for exit until the deadline. Returns nullopt on timeout.
std::optional<int> wait_until(pid_t pid, absl::Time deadline) {
    for (;;) {
        int status = 0;
        const pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) return status;
        if (done < 0 && errno != EINTR) return -1;
        if (absl::Now() >= deadline) return std::nullopt;
        absl::SleepFor(absl::Milliseconds(5));
    }
}

} // namespace

CommandInsightGenerator::CommandInsightGenerator(std::string command, absl::Duration timeout)
    : command_(std::move(command))
    , timeout_(timeout)
{
}

absl::StatusOr<std::string> CommandInsightGenerator::generate(const InsightRequest& request) {
    if (command_.empty()) {
        return absl::FailedPreconditionError("No insight command configured");
    }

    char path[] = "/tmp/therapy_lens_insight_XXXXXX";
    const int fd = ::mkstemp(path);
    if (fd < 0) {
        return absl::InternalError(
            absl::StrCat("Cannot create insight request file: ", std::strerror(errno)));
    }
    ::close(fd);
    ScopedTempFile request_file(path);

    {
        std::ofstream out(request_file.path(), std::ios::trunc);
        out << insight_request_to_json(request);
        if (!out) {
            return absl::InternalError(
                absl::StrCat("Cannot write insight request to ", request_file.path()));
        }
    }

    const std::string invocation = absl::StrCat(command_, " ", request_file.path());
    VLOG(1) << "Running insight command: " << invocation;

    int out_pipe[2];
    if (::pipe(out_pipe) != 0) {
        return absl::UnavailableError(absl::StrCat("Cannot create pipe: ", std::strerror(errno)));
    }

    const absl::Time deadline = absl::Now() + timeout_;
    const pid_t pid = ::fork();
    if (pid < 0) {
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return absl::UnavailableError(
            absl::StrCat("Cannot run insight command: ", std::strerror(errno)));
    }
    if (pid == 0) {
        // Child: own process group, stdout to the pipe, stdin away from the
        // dashboard's command channel
        ::setpgid(0, 0);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        const int null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
            ::close(null_fd);
        }
        ::execl("/bin/sh", "sh", "-c", invocation.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }
    ::setpgid(pid, pid);
    ::close(out_pipe[1]);

    std::string output;
    char buf[4096];
    bool timed_out = false;
    for (;;) {
        struct pollfd pfd{out_pipe[0], POLLIN, 0};
        const int ready = ::poll(&pfd, 1, remaining_ms(deadline));
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) {
            timed_out = true;
            break;
        }
        const ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        output.append(buf, static_cast<size_t>(n));
    }
    ::close(out_pipe[0]);

    std::optional<int> exit_status;
    if (!timed_out) {
        exit_status = wait_until(pid, deadline);
    }
    if (!exit_status) {
        kill_and_reap(pid);
        return absl::DeadlineExceededError(absl::StrCat(
            "Insight command did not finish within ", absl::FormatDuration(timeout_)));
    }

    if (*exit_status == -1 || !WIFEXITED(*exit_status) || WEXITSTATUS(*exit_status) != 0) {
        return absl::UnavailableError(
            absl::StrCat("Insight command failed with status ", *exit_status));
    }
    if (absl::StripAsciiWhitespace(output).empty()) {
        return absl::UnavailableError("Insight command produced no output");
    }
    return output;
}

} // namespace therapy_lens
