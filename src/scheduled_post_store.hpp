#pragma once

#include <string>
#include <utility>
#include <vector>

#include "data_types.hpp"
#include "error.hpp"

class ScheduledPostStoreInterface
{
public:
    virtual ~ScheduledPostStoreInterface() = default;

    // Add a post, or replace the one with the same ID.
    virtual E<void> saveScheduledPost(const ScheduledPost& post) = 0;
    // Ordered by scheduled time, earliest first.
    virtual E<std::vector<ScheduledPost>> scheduledPosts() = 0;
};

// Scheduled posts in a JSON file. The whole file is rewritten on every
// save.
class FileScheduledPostStore : public ScheduledPostStoreInterface
{
public:
    explicit FileScheduledPostStore(std::string path) : path(std::move(path)) {}

    E<void> saveScheduledPost(const ScheduledPost& post) override;
    E<std::vector<ScheduledPost>> scheduledPosts() override;

private:
    std::string path;
};
