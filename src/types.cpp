#include "types.hpp"

namespace archiver {

const char *toString(JobStatus status) {
  switch (status) {
  case JobStatus::Idle:
    return "idle";
  case JobStatus::Running:
    return "running";
  case JobStatus::Done:
    return "done";
  case JobStatus::Error:
    return "error";
  }
  return "unknown";
}

const char *toString(ArchiveStatus status) {
  switch (status) {
  case ArchiveStatus::Archived:
    return "archived";
  case ArchiveStatus::AlreadyArchived:
    return "already_archived";
  }
  return "unknown";
}

} // namespace archiver
