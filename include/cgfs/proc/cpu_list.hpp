#pragma once

#include <string>
#include <vector>

namespace cgfs {

/**
 * @brief Expand a kernel cpu list such as "0,2-4,7" into {0, 2, 3, 4, 7}
 *
 * Order and duplicates are kept as written. An empty or blank list expands to
 * nothing. Throws FsError(SERVICE_FAILURE) on a malformed list.
 */
std::vector<int> expandCpuList(const std::string& list);

/**
 * @brief Virtual index of @p cpu: the position of its first occurrence in @p cpus
 * @return -1 when @p cpu is not in the list
 */
int virtualCpuIndex(const std::vector<int>& cpus, int cpu);

} // namespace cgfs
