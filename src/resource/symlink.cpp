// resource/symlink.cpp - Symlink resource implementation
#include "symlink.hpp"
#include "../defs.hpp"
#include "../utils.hpp"

namespace converge {

SymlinkResource::SymlinkResource(SymlinkEntry entry)
    : entry_(std::move(entry)) {}

std::string SymlinkResource::kind() const { return KIND_SYMLINK; }

std::string SymlinkResource::description() const {
  return entry_.target.string() + " -> " + entry_.source.string();
}

State SymlinkResource::desired_state() const {
  return State::present(entry_.source.string());
}

State SymlinkResource::current_state() {
  const fs::path &target = entry_.target;
  if (!path_exists_no_follow(target))
    return State::absent();

  if (!is_symlink_path(target)) {
    return State::modified("regular", "symlink→" + entry_.source.string());
  }

  std::error_code ec;
  fs::path actual = fs::read_symlink(target, ec);
  if (ec) {
    throw Error::inspection_failed(KIND_SYMLINK, target.string() + ": " +
                                                     ec.message());
  }
  fs::path resolved =
      actual.is_absolute() ? actual : target.parent_path() / actual;

  if (canonical_or_self(resolved) == canonical_or_self(entry_.source))
    return State::present(entry_.source.string());
  return State::modified(actual.string(), entry_.source.string());
}

void SymlinkResource::link() {
  std::error_code ec;
  fs::create_symlink(entry_.source, entry_.target, ec);
  if (ec) {
    LOG_ERROR("symlink " + entry_.target.string() + ": " + ec.message());
    throw Error::permission(entry_.target.string());
  }
}

Outcome SymlinkResource::apply(const ApplyContext &ctx) {
  if (ctx.dry_run)
    return Outcome::skipped("dry-run");

  std::error_code ec;
  if (!path_exists_no_follow(entry_.source)) {
    throw Error::not_found(entry_.source.string());
  }

  State current = current_state();
  if (current == desired_state())
    return Outcome::no_change();

  fs::path parent = entry_.target.parent_path();
  if (!parent.empty() && !ensure_dir_exists(parent))
    throw Error::permission(parent.string());

  if (current.is_absent()) {
    link();
    return Outcome::created();
  }

  if (is_symlink_path(entry_.target)) {
    fs::remove(entry_.target, ec);
    if (ec)
      throw Error::permission(entry_.target.string());
    link();
    return Outcome::modified();
  }

  // A real file or directory sits at the target
  if (!entry_.force)
    return Outcome::skipped("File exists at " + entry_.target.string());

  fs::path backup = entry_.target;
  backup += ".bak";
  fs::rename(entry_.target, backup, ec);
  if (ec) {
    LOG_ERROR("backup " + entry_.target.string() + ": " + ec.message());
    throw Error::permission(entry_.target.string());
  }
  LOG_INFO("Moved " + entry_.target.string() + " to " + backup.string());
  link();
  return Outcome::modified();
}

} // namespace converge
