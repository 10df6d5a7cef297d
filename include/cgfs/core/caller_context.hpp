#pragma once

#include <sys/types.h>

namespace cgfs {

// Identity of the process issuing the current filesystem call
struct CallerContext {
    uid_t uid = 0;
    gid_t gid = 0;
    pid_t pid = 0;
};

} // namespace cgfs
