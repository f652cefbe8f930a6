//
//  tag_dict.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "tag_dict.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace tagforge {

bool iequals(const std::string &a, const std::string &b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (::toupper(static_cast<unsigned char>(a[i])) !=
            ::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

TagField *TagDict::find(const std::string &name) {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&](const TagField &f) { return iequals(f.name, name); });
    return it == fields_.end() ? nullptr : &*it;
}

const TagField *TagDict::find(const std::string &name) const {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&](const TagField &f) { return iequals(f.name, name); });
    return it == fields_.end() ? nullptr : &*it;
}

std::vector<std::string> TagDict::names() const {
    std::vector<std::string> out;
    out.reserve(fields_.size());
    for (const auto &f : fields_) {
        out.push_back(f.name);
    }
    return out;
}

bool TagDict::contains(const std::string &name) const { return find(name) != nullptr; }

std::vector<std::string> TagDict::get(const std::string &name) const {
    const TagField *f = find(name);
    return f ? f->values : std::vector<std::string>{};
}

std::string TagDict::first(const std::string &name, const std::string &fallback) const {
    const TagField *f = find(name);
    if (!f || f->values.empty()) {
        return fallback;
    }
    return f->values.front();
}

void TagDict::set(const std::string &name, std::vector<std::string> values) {
    if (TagField *f = find(name)) {
        f->values = std::move(values);
        return;
    }
    fields_.push_back(TagField{name, std::move(values)});
}

void TagDict::set(const std::string &name, const std::string &value) {
    set(name, std::vector<std::string>{value});
}

void TagDict::add(const std::string &name, const std::string &value) {
    if (TagField *f = find(name)) {
        f->values.push_back(value);
        return;
    }
    fields_.push_back(TagField{name, {value}});
}

bool TagDict::remove(const std::string &name) {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&](const TagField &f) { return iequals(f.name, name); });
    if (it == fields_.end()) {
        return false;
    }
    fields_.erase(it);
    return true;
}

bool TagDict::operator==(const TagDict &other) const {
    if (fields_.size() != other.fields_.size()) {
        return false;
    }
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name != other.fields_[i].name ||
            fields_[i].values != other.fields_[i].values) {
            return false;
        }
    }
    return true;
}

}  // namespace tagforge
