#define FUSE_USE_VERSION 31

#include <fuse.h>
#include <cerrno>
#include <cstring>
#include <new>

#include <cgfs/core/logger.hpp>
#include <cgfs/fuse/fuse_bridge.hpp>

namespace cgfs {

namespace {

const FilesystemDispatcher& dispatcher()
{
    return *static_cast<const FilesystemDispatcher*>(fuse_get_context()->private_data);
}

CallerContext caller()
{
    const fuse_context* context = fuse_get_context();
    return {context->uid, context->gid, context->pid};
}

// Runs one request, converting errors to the negative errno libfuse expects
template<typename Handler>
int handle(const char* operation, const char* path, Handler&& handler)
{
    try {
        return handler();
    }
    catch (const FsError& e) {
        Logger::getInstance()->debug("{} {} failed: {}", operation, path, e.what());
        return errnoFor(e);
    }
    catch (const std::bad_alloc&) {
        Logger::getInstance()->error("{} {} failed: out of memory", operation, path);
        return -ENOMEM;
    }
    catch (const std::exception& e) {
        Logger::getInstance()->error("{} {} failed unexpectedly: {}", operation, path, e.what());
        return -EIO;
    }
}

void* cgfsInit(fuse_conn_info*, fuse_config* config)
{
    // Content is regenerated per call, so the kernel must not cache data or sizes
    config->kernel_cache = 0;
    config->direct_io = 1;
    config->attr_timeout = 0;
    config->entry_timeout = 0;
    config->negative_timeout = 0;
    return fuse_get_context()->private_data;
}

int cgfsGetattr(const char* path, struct stat* st, fuse_file_info*)
{
    return handle("getattr", path, [&]() {
        FileAttributes attributes = dispatcher().getAttributes(path, caller());
        std::memset(st, 0, sizeof(struct stat));
        st->st_mode = attributes.mode;
        st->st_nlink = attributes.nlink;
        st->st_size = static_cast<off_t>(attributes.size);
        st->st_uid = attributes.uid;
        st->st_gid = attributes.gid;
        return 0;
    });
}

int cgfsReaddir(const char* path,
                void* buf,
                fuse_fill_dir_t filler,
                off_t,
                fuse_file_info*,
                fuse_readdir_flags)
{
    return handle("readdir", path, [&]() {
        for (const auto& name : dispatcher().listDirectory(path, caller())) {
            if (filler(buf, name.c_str(), nullptr, 0, static_cast<fuse_fill_dir_flags>(0)) != 0) {
                break;
            }
        }
        return 0;
    });
}

int cgfsOpen(const char* path, fuse_file_info* fi)
{
    return handle("open", path, [&]() {
        dispatcher().open(path, caller(), fi->flags);
        fi->direct_io = 1;
        fi->keep_cache = 0;
        return 0;
    });
}

int cgfsRead(const char* path, char* buf, size_t size, off_t offset, fuse_file_info*)
{
    return handle("read", path, [&]() {
        if (offset < 0) {
            return -EINVAL;
        }
        std::string window =
            dispatcher().read(path, caller(), size, static_cast<uint64_t>(offset));
        std::memcpy(buf, window.data(), window.size());
        return static_cast<int>(window.size());
    });
}

fuse_operations makeOperations()
{
    fuse_operations operations{};
    operations.init = cgfsInit;
    operations.getattr = cgfsGetattr;
    operations.readdir = cgfsReaddir;
    operations.open = cgfsOpen;
    operations.read = cgfsRead;
    return operations;
}

} // namespace

int runFilesystem(const FilesystemDispatcher& dispatcher, const std::vector<std::string>& fuse_args)
{
    std::vector<std::string> args = fuse_args;
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    fuse_operations operations = makeOperations();
    return fuse_main(static_cast<int>(args.size()), argv.data(), &operations,
                     const_cast<FilesystemDispatcher*>(&dispatcher));
}

} // namespace cgfs
