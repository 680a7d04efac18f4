#include "unix_system.h"

#include <dirent.h>
#include <limits.h>
#include <stdlib.h>
#include <sys/mman.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <functional>

namespace snapmcp {

namespace {

inline ErrnoOr<int> run_sys(std::function<int()> f) {
    ErrnoOr<int> ret;
    ret.value = f();
    ret.err = errno;
    if (ret.value < 0 && ret.err == EINTR) return run_sys(f);
    return (ret.value >= 0) ? ErrnoOr<int>{0, ret.value} : ret;
}

class FileDescriptorDef : public FileDescriptor {
  public:
    FileDescriptorDef(int fd) : fd(fd) {}
    virtual ~FileDescriptorDef() final { ::close(fd); }
    virtual int raw_fd() const final { return fd; }

    virtual ErrnoOr<int> read(void* buf, size_t len) final {
        return run_sys([&] {return ::read(fd, buf, len);});
    }

    virtual ErrnoOr<int> ioctl(uint32_t nr, void* buf) final {
        return run_sys([&] {return ::ioctl(fd, nr, buf);});
    }

    virtual ErrnoOr<std::shared_ptr<void>> mmap(
        size_t len, int prot, int flags, off_t off
    ) final {
        void* const mem = ::mmap(nullptr, len, prot, flags, fd, off);
        if (mem == MAP_FAILED) return {errno, {}};
        return {0, {mem, [len](void* m) {::munmap(m, len);}}};
    }

  private:
    int fd = -1;
};

class UnixSystemDef : public UnixSystem {
  public:
    virtual ErrnoOr<std::vector<std::string>> ls(
        std::string const& dir
    ) const final {
        std::unique_ptr<DIR, int (*)(DIR*)> dp(opendir(dir.c_str()), closedir);
        if (!dp) return {errno, {}};

        ErrnoOr<std::vector<std::string>> ret;
        while (dirent* ent = readdir(dp.get()))
            ret.value.push_back(ent->d_name);
        std::sort(ret.value.begin(), ret.value.end());
        return ret;
    }

    virtual ErrnoOr<struct stat> stat(std::string const& path) const final {
        ErrnoOr<struct stat> ret;
        ret.err = run_sys([&] {return ::stat(path.c_str(), &ret.value);}).err;
        return ret;
    }

    virtual ErrnoOr<std::string> realpath(std::string const& path) const final {
        char buf[PATH_MAX];
        if (!::realpath(path.c_str(), buf)) return {errno, {}};
        return {0, buf};
    }

    virtual ErrnoOr<std::unique_ptr<FileDescriptor>> open(
        std::string const& path, int flags, mode_t mode
    ) final {
        auto const r = run_sys([&] {return ::open(path.c_str(), flags, mode);});
        if (r.value < 0) return {r.err ? r.err : EBADF, {}};
        return {0, adopt(r.value)};
    }

    virtual std::unique_ptr<FileDescriptor> adopt(int raw_fd) final {
        return std::make_unique<FileDescriptorDef>(raw_fd);
    }

    virtual std::optional<std::string> getenv(
        std::string const& name
    ) const final {
        char const* const value = ::getenv(name.c_str());
        if (!value || !*value) return {};
        return std::string{value};
    }
};

}  // namespace

std::shared_ptr<UnixSystem> global_system() {
    static const auto system = std::make_shared<UnixSystemDef>();
    return system;
}

ErrnoOr<std::string> read_text_file(UnixSystem& sys, std::string const& path) {
    auto opened = sys.open(path, O_RDONLY | O_CLOEXEC);
    if (opened.err) return {opened.err, {}};

    ErrnoOr<std::string> ret;
    char buf[256];
    for (;;) {
        auto const r = opened.value->read(buf, sizeof(buf));
        if (r.err) return {r.err, {}};
        if (r.value == 0) break;
        ret.value.append(buf, r.value);
    }

    while (!ret.value.empty() && isspace(ret.value.back()))
        ret.value.pop_back();
    return ret;
}

}  // namespace snapmcp
