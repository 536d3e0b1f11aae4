#include "tuner-test-helpers.h"

#include "sztune/tuner/tuner-errors.h"
#include "sztune/tuner/workspace.h"

#include <fstream>

using namespace sztune::tuner;

namespace {

void
write_sized_file(const fs::path& path, uint64_t bytes)
{
    {
        std::ofstream out(path.string(), std::ios::binary | std::ios::trunc);
        ASSERT_TRUE(out.good()) << "cannot create " << path.string();
    }
    // Size only matters, keep it sparse
    fs::resize_file(path, bytes);
}

}  // namespace

FakeCompressor::FakeCompressor(fs::path root, SizeModel model)
    : root_(std::move(root)), model_(std::move(model))
{
}

void
FakeCompressor::compress(
    const CompressionParameters& params,
    const std::vector<std::string>& directories,
    const fs::path& output_dir)
{
    CompressCall call;
    call.params = params;
    call.directories = directories;
    call.output_dir = output_dir;
    call.root_archive_bytes = total_archive_size(root_);
    calls_.push_back(call);

    if (fail_on_call_ && calls_.size() == *fail_on_call_)
    {
        throw CompressorError("7z exited with status 2 (simulated)");
    }

    auto total = model_(params);
    if (directories.empty() || total == 0)
    {
        return;
    }

    // First archive takes the remainder so the sizes add up exactly
    auto share = total / directories.size();
    auto first = total - share * (directories.size() - 1);
    for (size_t i = 0; i < directories.size(); ++i)
    {
        write_sized_file(
            output_dir / (directories[i] + ARCHIVE_EXTENSION),
            i == 0 ? first : share);
    }
}

void
WorkingRootFixture::SetUp()
{
    root_ = fs::temp_directory_path() /
        fs::unique_path("sztune-test-%%%%-%%%%-%%%%");
    fs::create_directories(root_);
}

void
WorkingRootFixture::TearDown()
{
    boost::system::error_code ec;
    fs::remove_all(root_, ec);
}

fs::path
WorkingRootFixture::make_dir(const std::string& name, size_t file_bytes)
{
    auto dir = root_ / name;
    fs::create_directories(dir);
    if (file_bytes > 0)
    {
        // Incompressible-looking content so the disk usage is real
        std::ofstream out(
            (dir / "payload.bin").string(), std::ios::binary | std::ios::trunc);
        uint32_t state = 2463534242u;
        for (size_t i = 0; i < file_bytes; ++i)
        {
            state ^= state << 13;
            state ^= state >> 17;
            state ^= state << 5;
            out.put(static_cast<char>(state & 0xFF));
        }
    }
    return dir;
}

fs::path
WorkingRootFixture::make_file(const std::string& name, uint64_t bytes)
{
    auto path = root_ / name;
    write_sized_file(path, bytes);
    return path;
}

std::vector<std::string>
WorkingRootFixture::entries_with_prefix(const std::string& prefix) const
{
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(root_))
    {
        auto name = entry.path().filename().string();
        if (name.rfind(prefix, 0) == 0)
        {
            names.push_back(name);
        }
    }
    return names;
}
