#include <trellis/inference.hpp>
#include <trellis/log.hpp>
#include <trellis/subprocess.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <unistd.h>

namespace trellis {

namespace {

// Temporary file holding an attachment; unlinked on destruction
class TempFile {
public:
    TempFile() = default;
    ~TempFile() {
        if (!path_.empty()) ::unlink(path_.c_str());
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    Status write(const std::vector<uint8_t>& data, const std::string& suffix) {
        std::string tmpl = "/tmp/trellis_attachment_XXXXXX" + suffix;
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
        if (fd < 0) {
            return TrellisError{TrellisError::IO,
                std::string("cannot create attachment file: ") + strerror(errno)};
        }
        path_ = buf.data();

        size_t off = 0;
        while (off < data.size()) {
            ssize_t n = ::write(fd, data.data() + off, data.size() - off);
            if (n < 0) {
                if (errno == EINTR) continue;
                int saved = errno;
                ::close(fd);
                return TrellisError{TrellisError::IO,
                    "cannot write attachment file " + path_ + ": " + strerror(saved)};
            }
            off += static_cast<size_t>(n);
        }
        ::close(fd);
        return ok_status();
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

std::string suffix_for(const std::string& mime_type) {
    if (mime_type == "image/png") return ".png";
    if (mime_type == "image/jpeg" || mime_type == "image/jpg") return ".jpg";
    if (mime_type == "image/gif") return ".gif";
    if (mime_type == "image/webp") return ".webp";
    return ".bin";
}

} // namespace

CommandInferenceClient::CommandInferenceClient(InferenceSettings settings)
    : settings_(std::move(settings)) {}

Result<std::string> CommandInferenceClient::invoke(
        const std::string& prompt, const std::optional<Attachment>& attachment) {
    if (settings_.command.empty()) {
        return TrellisError{TrellisError::Transport,
            "no inference command configured",
            "set [inference] command in " + default_config_path()};
    }

    std::vector<std::string> args = settings_.command;
    TempFile file;
    if (attachment) {
        auto st = file.write(attachment->data, suffix_for(attachment->mime_type));
        if (st.is_err()) {
            return TrellisError{TrellisError::Transport, st.error().message};
        }
        args.push_back(file.path());
    }

    log::debug("invoking '%s' (%zu byte prompt%s)",
               args[0].c_str(), prompt.size(), attachment ? ", with attachment" : "");

    auto result = run_command(args, prompt, settings_.timeout_seconds);
    if (result.is_err()) {
        auto err = std::move(result).error();
        // Every collaborator failure reaches callers as Transport
        err.code = TrellisError::Transport;
        return err;
    }

    auto& cmd = result.value();
    if (cmd.exit_code != 0) {
        std::string detail = cmd.stderr_str;
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
            detail.pop_back();
        }
        return TrellisError{TrellisError::Transport,
            "'" + args[0] + "' exited with code " + std::to_string(cmd.exit_code),
            detail};
    }
    return Result<std::string>::ok(std::move(cmd.stdout_str));
}

} // namespace trellis
