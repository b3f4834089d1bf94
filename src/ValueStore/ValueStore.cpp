// === src/ValueStore/ValueStore.cpp ===
#include "ValueStore.hpp"
#include "CacheErrors.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <memory>
#include <thread>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#include <openssl/evp.h>

static const int kLockAttempts      = 200;
static const int kLockMaxBackoffMs  = 64;

namespace {

std::string errno_text(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

// Exclusive flock on a reference-count sidecar. The sidecar can be unlinked
// by release() while another process waits on it, so the lock is only kept
// once the locked inode is still the one the path names.
class RefLock {
public:
    explicit RefLock(const std::string& path) : path_(path) {
        int backoff_ms = 1;
        for (int attempt = 0; attempt < kLockAttempts; ++attempt) {
            int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
            if (fd == -1) throw EngineError(errno_text("[ValueStore] open", path_));

            if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
                struct stat held{}, named{};
                if (::fstat(fd, &held) == 0 && ::stat(path_.c_str(), &named) == 0 &&
                    held.st_ino == named.st_ino && held.st_dev == named.st_dev) {
                    fd_ = fd;
                    return;
                }
                ::close(fd);
                continue;
            }
            const int err = errno;
            ::close(fd);
            if (err != EWOULDBLOCK && err != EINTR) {
                errno = err;
                throw EngineError(errno_text("[ValueStore] flock", path_));
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
            backoff_ms = std::min(backoff_ms * 2, kLockMaxBackoffMs);
        }
        throw EngineError("[ValueStore] could not lock " + path_);
    }

    ~RefLock() {
        if (fd_ >= 0) ::close(fd_);   // closing drops the flock
    }

    RefLock(const RefLock&) = delete;
    RefLock& operator=(const RefLock&) = delete;

    int64_t read_count() const {
        char buf[32] = {0};
        ssize_t n = ::pread(fd_, buf, sizeof(buf) - 1, 0);
        if (n < 0) throw EngineError(errno_text("[ValueStore] read", path_));
        return n == 0 ? 0 : std::strtoll(buf, nullptr, 10);
    }

    void write_count(int64_t count) {
        const std::string s = std::to_string(count);
        if (::ftruncate(fd_, 0) != 0 ||
            ::pwrite(fd_, s.data(), s.size(), 0) != static_cast<ssize_t>(s.size())) {
            throw EngineError(errno_text("[ValueStore] write", path_));
        }
    }

    void unlink() {
        if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
            throw EngineError(errno_text("[ValueStore] unlink", path_));
        }
    }

private:
    std::string path_;
    int fd_ = -1;
};

void write_all(int fd, const std::string& data, const std::string& path) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw EngineError(errno_text("[ValueStore] write", path));
        }
        off += static_cast<size_t>(n);
    }
}

} // namespace


ValueStore::ValueStore(std::string directory, size_t raw_max_size)
    : directory_(std::move(directory)), raw_max_size_(raw_max_size) {}

std::string ValueStore::content_path(const std::string& sig) const {
    return directory_ + "/" + sig;
}

std::string ValueStore::ref_path(const std::string& sig) const {
    return directory_ + "/" + sig + ".ref";
}

// Desc: hex MD5 digest of data
// In: const std::string& data
// Out: std::string (32 hex chars)
std::string ValueStore::md5_hex(const std::string& data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), out, &len, EVP_md5(), nullptr) != 1) {
        throw EngineError("[ValueStore] EVP_Digest(md5) failed");
    }
    static const char* hex = "0123456789abcdef";
    std::string h(len * 2, '0');
    for (unsigned int i = 0; i < len; i++) {
        h[2*i]   = hex[(out[i] >> 4) & 0xF];
        h[2*i+1] = hex[out[i] & 0xF];
    }
    return h;
}


// Desc: map a value to its storage format; oversized payloads are handed
//       back through spill and the returned payload is left empty
// In: const Value& v, std::optional<std::string>& spill
// Out: Dumped
ValueStore::Dumped ValueStore::encode(const Value& v, std::optional<std::string>& spill) const {
    switch (v.type()) {
        case Value::Type::None:
            return {Value(), DataFormat::Raw};

        case Value::Type::Integer:
        case Value::Type::Real:
            return {v, DataFormat::Number};

        case Value::Type::String:
            if (v.as_string().size() < raw_max_size_) return {v, DataFormat::Raw};
            spill = v.as_string();
            return {Value(), DataFormat::FileString};

        case Value::Type::Bytes: {
            const Bytes& b = v.as_bytes();
            if (b.size() < raw_max_size_) return {v, DataFormat::Raw};
            spill = std::string(b.begin(), b.end());
            return {Value(), DataFormat::FileBytes};
        }

        case Value::Type::Object: {
            Bytes packed = nlohmann::json::to_cbor(v.as_object());
            if (packed.size() < raw_max_size_) return {Value(std::move(packed)), DataFormat::Pickle};
            spill = std::string(packed.begin(), packed.end());
            return {Value(), DataFormat::FilePickle};
        }
    }
    throw EngineError("[ValueStore] unsupported value type");
}

ValueStore::Dumped ValueStore::dump(const Value& v) {
    std::optional<std::string> spill;
    Dumped d = encode(v, spill);
    if (spill) d.first = Value(write(*spill));
    return d;
}

ValueStore::Dumped ValueStore::signature(const Value& v) const {
    std::optional<std::string> spill;
    Dumped d = encode(v, spill);
    if (spill) d.first = Value(md5_hex(*spill));
    return d;
}

static Value decode_object(const std::string& packed) {
    try {
        return Value(nlohmann::json::from_cbor(packed));
    } catch (const nlohmann::json::exception& e) {
        throw EngineError(std::string("[ValueStore] corrupt object payload: ") + e.what());
    }
}

// Desc: inverse of dump()
// In: const Value& payload, DataFormat fmt
// Out: std::optional<Value> (empty when the overflow file has vanished)
std::optional<Value> ValueStore::load(const Value& payload, DataFormat fmt) const {
    switch (fmt) {
        case DataFormat::Raw:
        case DataFormat::Number:
            return payload;

        case DataFormat::Pickle: {
            const Bytes& b = payload.as_bytes();
            return decode_object(std::string(b.begin(), b.end()));
        }

        case DataFormat::FileString:
        case DataFormat::FileBytes:
        case DataFormat::FilePickle: {
            auto data = read(payload.as_string());
            if (!data) {
                Logger::warn("ValueStore", "stored file " + content_path(payload.as_string()) + " not found");
                return std::nullopt;
            }
            if (fmt == DataFormat::FileString) return Value(std::move(*data));
            if (fmt == DataFormat::FileBytes)  return Value(Bytes(data->begin(), data->end()));
            return decode_object(*data);
        }
    }
    throw EngineError("[ValueStore] unknown format " + std::to_string(static_cast<int>(fmt)));
}


// Desc: store data under its digest, or add a reference when it exists
// In: const std::string& data
// Out: std::string (digest)
std::string ValueStore::write(const std::string& data) {
    const std::string sig = md5_hex(data);
    const std::string target = content_path(sig);

    RefLock lock(ref_path(sig));
    int64_t count = lock.read_count();

    if (::access(target.c_str(), F_OK) == 0) {
        count = (count > 0 ? count : 0) + 1;
    } else {
        const std::string tmp = target + ".tmp." + std::to_string(::getpid()) + "." +
                                std::to_string(std::hash<std::thread::id>()(std::this_thread::get_id()));
        int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd == -1) throw EngineError(errno_text("[ValueStore] create", tmp));
        try {
            write_all(fd, data, tmp);
        } catch (...) {
            ::close(fd);
            ::unlink(tmp.c_str());
            throw;
        }
        ::close(fd);

        // link() is the atomic create-if-absent step
        if (::link(tmp.c_str(), target.c_str()) != 0 && errno != EEXIST) {
            const std::string e = errno_text("[ValueStore] link", target);
            ::unlink(tmp.c_str());
            throw EngineError(e);
        }
        ::unlink(tmp.c_str());
        count = 1;
    }
    lock.write_count(count);
    return sig;
}

// Desc: read overflow content without locking
// In: const std::string& sig
// Out: std::optional<std::string> (empty if the file is gone)
std::optional<std::string> ValueStore::read(const std::string& sig) const {
    const std::string path = content_path(sig);
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        if (errno == ENOENT) return std::nullopt;
        throw EngineError(errno_text("[ValueStore] open", path));
    }
    std::unique_ptr<int, void (*)(int*)> guard(&fd, [](int* p) { ::close(*p); });

    std::string out;
    char buf[1 << 16];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            throw EngineError(errno_text("[ValueStore] read", path));
        }
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

// Desc: drop one reference; remove content and sidecar with the last one
// In: const std::string& sig
// Out: bool (true if the content file was removed)
bool ValueStore::release(const std::string& sig) {
    RefLock lock(ref_path(sig));
    const int64_t count = lock.read_count() - 1;
    if (count > 0) {
        lock.write_count(count);
        return false;
    }
    const std::string target = content_path(sig);
    bool removed = ::unlink(target.c_str()) == 0;
    if (!removed && errno != ENOENT) {
        throw EngineError(errno_text("[ValueStore] unlink", target));
    }
    lock.unlink();
    return removed;
}

int64_t ValueStore::references(const std::string& sig) const {
    const std::string path = ref_path(sig);
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) return 0;
    char buf[32] = {0};
    ssize_t n = ::pread(fd, buf, sizeof(buf) - 1, 0);
    ::close(fd);
    return n > 0 ? std::strtoll(buf, nullptr, 10) : 0;
}
