#pragma once
#include <string>
#include <vector>

namespace octavius::protocol {

    // A job's registered descriptive record. Stored under "metadata/<name>".
    struct Metadata {
        std::string name;
        std::string author;
        std::string image_name;  // Image reference the executor runs
        std::string description;
    };

    inline bool operator==(const Metadata& lhs, const Metadata& rhs) {
        return lhs.name == rhs.name && lhs.author == rhs.author &&
               lhs.image_name == rhs.image_name &&
               lhs.description == rhs.description;
    }

    inline bool operator!=(const Metadata& lhs, const Metadata& rhs) {
        return !(lhs == rhs);
    }

    // Names present in the store at scan time, in scan order. Never persisted.
    struct JobList {
        std::vector<std::string> jobs;
    };

} // namespace octavius::protocol
