//
//  tag_dict.hpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

namespace tagforge {

struct TagField {
    std::string name;                 ///< stored as given (e.g. "Title" stays "Title")
    std::vector<std::string> values;  ///< one or more values, container order
};

/**
 * @brief Ordered tag dictionary backed by a VORBIS_COMMENT block.
 *
 * Field order is insertion order. Name lookup is ASCII case-insensitive, which is the
 * Vorbis comment convention; names keep the spelling they were first stored with.
 */
class TagDict {
   public:
    const std::vector<TagField> &fields() const { return fields_; }
    bool empty() const { return fields_.empty(); }
    size_t size() const { return fields_.size(); }

    // Field names in order.
    std::vector<std::string> names() const;

    bool contains(const std::string &name) const;

    // All values for `name`; empty when absent.
    std::vector<std::string> get(const std::string &name) const;

    // First value for `name`, or `fallback` when absent.
    std::string first(const std::string &name, const std::string &fallback = {}) const;

    // Replace the values of `name`, appending the field when it is new.
    void set(const std::string &name, std::vector<std::string> values);
    void set(const std::string &name, const std::string &value);

    // Append a value, creating the field at the end when needed.
    void add(const std::string &name, const std::string &value);

    bool remove(const std::string &name);
    void clear() { fields_.clear(); }

    bool operator==(const TagDict &other) const;
    bool operator!=(const TagDict &other) const { return !(*this == other); }

   private:
    TagField *find(const std::string &name);
    const TagField *find(const std::string &name) const;

    std::vector<TagField> fields_;
};

bool iequals(const std::string &a, const std::string &b);

}  // namespace tagforge
