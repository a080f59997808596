#include "types.hpp"

Status next_status(Status s) {
  switch (s) {
    case Status::ToDo: return Status::UpNext;
    case Status::UpNext: return Status::InProgress;
    case Status::InProgress: return Status::ToDo;
  }
  return Status::ToDo;
}

Status prev_status(Status s) {
  switch (s) {
    case Status::ToDo: return Status::InProgress;
    case Status::InProgress: return Status::UpNext;
    case Status::UpNext: return Status::ToDo;
  }
  return Status::ToDo;
}

const char* status_name(Status s) {
  switch (s) {
    case Status::ToDo: return "To Do";
    case Status::UpNext: return "Up Next";
    case Status::InProgress: return "In Progress";
  }
  return "?";
}

const char* severity_name(Severity s) {
  switch (s) {
    case Severity::Info: return "INFO";
    case Severity::Warning: return "WARNING";
    case Severity::Error: return "ERROR";
    case Severity::Critical: return "CRITICAL";
  }
  return "?";
}
