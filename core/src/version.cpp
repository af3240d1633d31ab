#include "reqnav/version.h"

namespace reqnav {

#ifndef REQNAV_VERSION
#define REQNAV_VERSION "0.1.0"
#endif

#ifndef REQNAV_GIT_COMMIT
#define REQNAV_GIT_COMMIT "unknown"
#endif

#ifndef REQNAV_GIT_DIRTY
#define REQNAV_GIT_DIRTY 0
#endif

VersionInfo get_version_info() {
  VersionInfo info;
  info.version = REQNAV_VERSION;
  info.git_commit = REQNAV_GIT_COMMIT;
  info.git_dirty = (REQNAV_GIT_DIRTY != 0);
  return info;
}

std::string version_string() {
  const VersionInfo info = get_version_info();
  std::string out = info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  out += ")";
  return out;
}

}  // namespace reqnav
