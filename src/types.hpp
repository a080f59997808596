#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Status/Item/Severity/LogEntry).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <string>

enum class Status { ToDo, UpNext, InProgress };

enum class Severity { Info, Warning, Error, Critical };

struct Item {
  std::string label;
  int weight = 1;
  Status status = Status::ToDo;
};

struct LogEntry {
  std::string label;
  Severity severity = Severity::Info;
};

Status next_status(Status s);
Status prev_status(Status s);
const char* status_name(Status s);
const char* severity_name(Severity s);
