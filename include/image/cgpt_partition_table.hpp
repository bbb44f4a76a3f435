#pragma once

#include "image/partition_table.hpp"
#include "system/subprocess.hpp"

#include <memory>
#include <string>
#include <vector>

namespace fpack {

// IPartitionTable backed by the cgpt command line tool.
class CgptPartitionTable final : public IPartitionTable {
  public:
    static constexpr const char* kTool = "cgpt";

    CgptPartitionTable(std::string image_path, std::shared_ptr<const ICommandRunner> runner);

    const std::string& ImagePath() const override { return image_path_; }

    Result Find(int number, PartitionExtent& out) const override;
    Result List(std::vector<PartitionExtent>& out) const override;
    Result Create() override;
    Result Add(const PartitionSpec& spec) override;
    Result Resize(int number, std::uint64_t sector_count) override;
    Result SetAttributes(int number, const PartitionAttributes& attrs) override;
    Result WriteBootCode(const std::string& pmbr_path) override;

    // Parses `cgpt show -q` output: one "start size number type..." line per entry.
    static Result ParseQuickListing(const std::string& text, std::vector<PartitionExtent>& out);

  private:
    Result Run(std::vector<std::string> args, std::string* out = nullptr) const;
    Result QueryNumber(int number, const char* field, std::uint64_t& out) const;

    std::string image_path_;
    std::shared_ptr<const ICommandRunner> runner_;
};

PartitionTableOpener CgptTableOpener(std::shared_ptr<const ICommandRunner> runner);

} // namespace fpack
