// cgpt_partition_table.cpp - Partition table access through the cgpt tool.

#include "image/cgpt_partition_table.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <charconv>
#include <sstream>

namespace fpack {

namespace {

bool ParseU64(std::string_view s, std::uint64_t& out) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == '\n' || s.back() == ' ' || s.back() == '\r'))
        s.remove_suffix(1);
    if (s.empty()) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

} // namespace

CgptPartitionTable::CgptPartitionTable(std::string image_path,
                                       std::shared_ptr<const ICommandRunner> runner)
    : image_path_(std::move(image_path)), runner_(std::move(runner)) {}

Result CgptPartitionTable::Run(std::vector<std::string> args, std::string* out) const {
    args.insert(args.begin(), kTool);
    args.push_back(image_path_);
    return runner_->Run(args, out);
}

Result CgptPartitionTable::QueryNumber(int number, const char* field, std::uint64_t& out) const {
    std::string text;
    auto r = Run({"show", "-i", std::to_string(number), field, "-q"}, &text);
    if (!r.is_ok()) {
        return Result::Fail(ENOENT, "Partition #" + std::to_string(number) + " not found in " +
                                        image_path_ + " (" + r.msg + ")");
    }
    if (!ParseU64(text, out)) {
        return Result::Fail(EBADMSG, "Unexpected cgpt output for " + image_path_ + ": '" + text + "'");
    }
    return Result::Ok();
}

Result CgptPartitionTable::Find(int number, PartitionExtent& out) const {
    std::uint64_t begin = 0;
    std::uint64_t size = 0;
    if (auto r = QueryNumber(number, "-b", begin); !r.is_ok()) return r;
    if (auto r = QueryNumber(number, "-s", size); !r.is_ok()) return r;
    if (size == 0) {
        return Result::Fail(ENOENT, "Partition #" + std::to_string(number) + " is empty in " +
                                        image_path_);
    }
    out = PartitionExtent{.number = number, .first_sector = begin, .sector_count = size};
    return Result::Ok();
}

Result CgptPartitionTable::ParseQuickListing(const std::string& text,
                                             std::vector<PartitionExtent>& out) {
    out.clear();
    std::istringstream is(text);
    std::string line;
    while (std::getline(is, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        std::istringstream ls(line);
        std::uint64_t start = 0;
        std::uint64_t size = 0;
        int number = 0;
        if (!(ls >> start >> size >> number)) {
            return Result::Fail(EBADMSG, "Malformed cgpt listing line: '" + line + "'");
        }
        if (size == 0) continue;
        out.push_back(PartitionExtent{.number = number, .first_sector = start, .sector_count = size});
    }
    return Result::Ok();
}

Result CgptPartitionTable::List(std::vector<PartitionExtent>& out) const {
    std::string text;
    auto r = Run({"show", "-q", "-n"}, &text);
    if (!r.is_ok()) return r.Wrap("Cannot list partitions of " + image_path_);
    return ParseQuickListing(text, out);
}

Result CgptPartitionTable::Create() {
    auto r = Run({"create"});
    if (!r.is_ok()) return r.Wrap("Cannot create GPT on " + image_path_);
    return Result::Ok();
}

Result CgptPartitionTable::Add(const PartitionSpec& spec) {
    auto r = Run({"add",
                  "-i", std::to_string(spec.number),
                  "-b", std::to_string(spec.first_sector),
                  "-s", std::to_string(spec.sector_count),
                  "-t", PartitionTypeName(spec.type),
                  "-l", spec.label});
    if (!r.is_ok()) {
        return r.Wrap("Cannot add partition #" + std::to_string(spec.number) + " to " + image_path_);
    }
    return Result::Ok();
}

Result CgptPartitionTable::Resize(int number, std::uint64_t sector_count) {
    auto r = Run({"add", "-i", std::to_string(number), "-s", std::to_string(sector_count)});
    if (!r.is_ok()) {
        return r.Wrap("Cannot resize partition #" + std::to_string(number) + " of " + image_path_);
    }
    return Result::Ok();
}

Result CgptPartitionTable::SetAttributes(int number, const PartitionAttributes& attrs) {
    std::vector<std::string> args = {"add",
                                     "-i", std::to_string(number),
                                     "-P", std::to_string(attrs.priority),
                                     "-T", std::to_string(attrs.tries),
                                     "-S", attrs.successful ? "1" : "0"};
    if (attrs.type) {
        args.push_back("-t");
        args.push_back(PartitionTypeName(*attrs.type));
    }
    auto r = Run(std::move(args));
    if (!r.is_ok()) {
        return r.Wrap("Cannot set attributes of partition #" + std::to_string(number) + " in " +
                      image_path_);
    }
    return Result::Ok();
}

Result CgptPartitionTable::WriteBootCode(const std::string& pmbr_path) {
    auto r = Run({"boot", "-p", "-b", pmbr_path});
    if (!r.is_ok()) return r.Wrap("Cannot write PMBR boot code to " + image_path_);
    return Result::Ok();
}

PartitionTableOpener CgptTableOpener(std::shared_ptr<const ICommandRunner> runner) {
    return [runner](const std::string& image_path) -> std::shared_ptr<IPartitionTable> {
        return std::make_shared<CgptPartitionTable>(image_path, runner);
    };
}

} // namespace fpack
