#include "commands.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>
#include <fmt/core.h>

#include "print.hpp"
#include "todoffi/core/todo.hpp"
#include "todoffi/sdk/todo_list.hpp"
#include "todoffi/todoffi.h"

namespace todoffi::driver {

namespace {

auto PrintEntries(const sdk::TodoList& list) -> int {
  auto count = list.Count();
  if (!count) {
    PrintError(count.error());
    return 1;
  }
  for (size_t i = 0; i < *count; ++i) {
    auto line = list.FormatAt(i);
    if (!line) {
      PrintError(line.error());
      return 1;
    }
    fmt::print("{}\n", *line);
  }
  return 0;
}

}  // namespace

auto DemoCommand(const argparse::ArgumentParser& /*cmd*/) -> int {
  auto list = sdk::TodoList::Create();
  if (!list) {
    PrintError(list.error());
    return 1;
  }

  const std::vector<core::Todo> seed = {
      {.id = 1, .note = "buy milk"},
      {.id = 2, .note = "write report"},
      {.id = 3, .note = "call a friend"},
  };
  for (const auto& todo : seed) {
    if (auto added = list->Add(todo.id, todo.note); !added) {
      PrintError(added.error());
      return 1;
    }
  }

  if (int rc = PrintEntries(*list); rc != 0) {
    return rc;
  }

  auto count = list->Count();
  if (!count) {
    PrintError(count.error());
    return 1;
  }
  fmt::print("count: {}\n", *count);

  auto id = list->IdAt(1);
  auto note = list->NoteAt(1);
  if (!id || !note) {
    PrintError(!id ? id.error() : note.error());
    return 1;
  }
  fmt::print("entry 1: id={} note=\"{}\"\n", *id, *note);

  auto past_end = list->NoteAt(*count);
  if (past_end) {
    PrintError(fmt::format("entry {} unexpectedly present", *count));
    return 1;
  }
  fmt::print(
      "entry {}: {}\n", *count,
      ErrorCodeName(past_end.error().code));
  return 0;
}

auto ListCommand(const argparse::ArgumentParser& cmd) -> int {
  auto notes_arg = cmd.present<std::vector<std::string>>("notes");
  if (!notes_arg || notes_arg->empty()) {
    PrintError("no notes given");
    return 1;
  }
  const auto& notes = *notes_arg;

  auto list = sdk::TodoList::Create();
  if (!list) {
    PrintError(list.error());
    return 1;
  }

  std::vector<core::Todo> batch;
  batch.reserve(notes.size());
  for (size_t i = 0; i < notes.size(); ++i) {
    batch.push_back(
        core::Todo{.id = static_cast<int32_t>(i + 1), .note = notes[i]});
  }
  if (auto added = list->AddBatch(batch); !added) {
    PrintError(added.error());
    return 1;
  }
  return PrintEntries(*list);
}

auto StressCommand(const argparse::ArgumentParser& cmd) -> int {
  auto cycles = cmd.get<int>("--cycles");
  auto items = cmd.get<int>("--items");
  if (cycles < 0 || items < 0) {
    PrintError("--cycles and --items must be non-negative");
    return 1;
  }
  if (cycles == 0) {
    PrintWarning("--cycles is 0, only reporting current stats");
  }

  for (int cycle = 0; cycle < cycles; ++cycle) {
    auto list = sdk::TodoList::Create();
    if (!list) {
      PrintError(list.error());
      return 1;
    }
    for (int item = 0; item < items; ++item) {
      if (auto added = list->Add(item, fmt::format("note {}-{}", cycle, item));
          !added) {
        PrintError(added.error());
        return 1;
      }
    }
    for (int item = 0; item < items; ++item) {
      auto note = list->NoteAt(static_cast<size_t>(item));
      if (!note) {
        PrintError(note.error());
        return 1;
      }
    }
  }

  auto stats = sdk::RuntimeStats();
  if (!stats) {
    PrintError(stats.error());
    return 1;
  }
  fmt::print(
      "cycles: {}\nitems: {}\nlists created: {}\nlists released: {}\n"
      "live lists: {}\nslot capacity: {}\noutstanding strings: {}\n",
      cycles, items, stats->lists_created, stats->lists_released,
      stats->live_lists, stats->slot_capacity, stats->outstanding_strings);

  if (stats->live_lists != 0 || stats->outstanding_strings != 0) {
    PrintError("leak detected");
    return 1;
  }
  return 0;
}

auto VersionCommand(const argparse::ArgumentParser& /*cmd*/) -> int {
  fmt::print("todoffi ABI version {}\n", TodoFfiAbiVersion());
  return 0;
}

}  // namespace todoffi::driver
