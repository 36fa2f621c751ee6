#include "core/InputScript.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

#include <toml++/toml.h>

#include "util/TomlUtil.h"

bool InputScript::appendFromToml(const std::filesystem::path& path,
                                 std::unordered_set<std::string>& seen) {
  const std::filesystem::path normalized = path.lexically_normal();
  const std::string pathStr = normalized.string();
  if (pathStr.empty()) {
    return false;
  }

  if (!seen.insert(pathStr).second) {
    TomlUtil::warnf(pathStr.c_str(), "input script include cycle detected; skipping");
    return true;
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(pathStr);
  } catch (const toml::parse_error& err) {
    std::printf("InputScript: parse error in %s: %s\n", pathStr.c_str(), err.what());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, pathStr.c_str(), "root", {"version", "keyframes", "include"});

  int version = 1;
  if (auto v = tbl["version"].value<int>())
    version = *v;
  if (version != 1) {
    TomlUtil::warnf(pathStr.c_str(), "input script version {} (expected 1)", version);
  }

  if (auto include = tbl["include"].value<std::string>()) {
    const std::filesystem::path includePath = normalized.parent_path() / *include;
    if (!appendFromToml(includePath, seen)) {
      return false;
    }
  } else if (tbl.contains("include")) {
    TomlUtil::warnf(pathStr.c_str(), "include must be a string path");
  }

  const toml::array* framesArr = tbl["keyframes"].as_array();
  if (!framesArr)
    return true;

  std::size_t idx = 0;
  for (const auto& node : *framesArr) {
    auto t = node.as_table();
    ++idx;
    if (!t)
      continue;

    const std::string scope = "keyframes[" + std::to_string(idx - 1) + "]";
    TomlUtil::warnUnknownKeys(*t, pathStr.c_str(), scope,
                              {"frame", "left", "right", "jump", "start", "pick"});

    const int f = (*t)["frame"].value_or(-1);
    if (f < 0) {
      TomlUtil::warnf(pathStr.c_str(), "{} missing frame (use frame = N)", scope);
      continue;
    }

    Keyframe kf{};
    kf.frame = static_cast<uint64_t>(f);

    if (auto v = t->get("left")) {
      kf.mask |= kLeft;
      kf.values.movingLeft = v->value_or(false);
    }
    if (auto v = t->get("right")) {
      kf.mask |= kRight;
      kf.values.movingRight = v->value_or(false);
    }
    if (auto v = t->get("jump")) {
      kf.mask |= kJump;
      kf.values.tryingToJump = v->value_or(false);
    }
    if (auto v = t->get("start"))
      kf.actions.start = v->value_or(false);
    if (auto v = t->get("pick")) {
      const int slot = v->value_or(0);
      if (slot < 1 || slot > 3) {
        TomlUtil::warnf(pathStr.c_str(), "{} pick must be 1, 2 or 3", scope);
      } else {
        kf.actions.pickSlot = slot - 1;
      }
    }

    keyframes_.push_back(kf);
  }

  return true;
}

bool InputScript::loadFromToml(const char* path) {
  keyframes_.clear();
  intent_ = nutfall::MoveIntent{};
  nextIndex_ = 0;
  lastFrame_ = 0;
  hasLastFrame_ = false;
  loaded_ = false;
  path_ = path ? path : "";

  std::unordered_set<std::string> seen;
  if (!appendFromToml(path_, seen)) {
    return false;
  }

  std::stable_sort(keyframes_.begin(), keyframes_.end(),
                   [](const Keyframe& a, const Keyframe& b) { return a.frame < b.frame; });

  loaded_ = true;
  return true;
}

void InputScript::reset() {
  intent_ = nutfall::MoveIntent{};
  nextIndex_ = 0;
  lastFrame_ = 0;
  hasLastFrame_ = false;
}

ScriptActions InputScript::advance(uint64_t frame) {
  ScriptActions out{};
  if (!loaded_)
    return out;

  if (hasLastFrame_ && frame < lastFrame_) {
    reset();
  }

  while (nextIndex_ < keyframes_.size() && keyframes_[nextIndex_].frame <= frame) {
    const Keyframe& kf = keyframes_[nextIndex_];
    if ((kf.mask & kLeft) != 0U)
      intent_.movingLeft = kf.values.movingLeft;
    if ((kf.mask & kRight) != 0U)
      intent_.movingRight = kf.values.movingRight;
    if ((kf.mask & kJump) != 0U)
      intent_.tryingToJump = kf.values.tryingToJump;
    out.start = out.start || kf.actions.start;
    if (kf.actions.pickSlot >= 0)
      out.pickSlot = kf.actions.pickSlot;
    ++nextIndex_;
  }

  lastFrame_ = frame;
  hasLastFrame_ = true;
  return out;
}
