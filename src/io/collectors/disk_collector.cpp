#include "disk_collector.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <cstring>
#include <sys/statvfs.h>

DiskCollector::DiskCollector(const std::string &mount_point)
    : mount_point_(mount_point) {}

double DiskCollector::sample() {
  struct statvfs st;
  if (statvfs(mount_point_.c_str(), &st) != 0)
    throw TransientReadError("statvfs(" + mount_point_ +
                             ") failed: " + std::strerror(errno));

  // Blocks reserved for root count as neither used nor available
  unsigned long long used =
      static_cast<unsigned long long>(st.f_blocks - st.f_bfree);
  unsigned long long usable =
      used + static_cast<unsigned long long>(st.f_bavail);
  if (usable == 0)
    throw TransientReadError("mount point " + mount_point_ + " reports no blocks");

  double usage = 100.0 * static_cast<double>(used) / static_cast<double>(usable);
  LOG(LogLevel::TRACE, LogComponent::IO_COLLECTOR,
      "Disk " << mount_point_ << " usage " << usage << "%");
  return usage;
}
