#pragma once

#include <string>
#include <vector>

#include <cgfs/fs/dispatcher.hpp>

namespace cgfs {

/**
 * @brief Mount the filesystem and serve requests until unmounted
 * @param dispatcher Handles every call; must outlive the mount
 * @param fuse_args Full libfuse argument vector, program name first
 * @return fuse_main's exit status
 */
int runFilesystem(const FilesystemDispatcher& dispatcher, const std::vector<std::string>& fuse_args);

} // namespace cgfs
