// src/reactions/core/FileIo.cpp
#include "reactions/core/FileIo.hpp"

#include <fstream>
#include <system_error>

namespace reactions::io {

namespace {

void SetError(std::string* err, std::string msg)
{
    if (err)
        *err = std::move(msg);
}

void StripUtf8Bom(std::string& s)
{
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEFu &&
        static_cast<unsigned char>(s[1]) == 0xBBu &&
        static_cast<unsigned char>(s[2]) == 0xBFu)
    {
        s.erase(0, 3);
    }
}

} // namespace

bool read_all(const fs::path& path, std::string& out, std::string* err)
{
    out.clear();

    std::ifstream f(path, std::ios::binary);
    if (!f)
    {
        SetError(err, "cannot open " + path.string());
        return false;
    }

    f.seekg(0, std::ios::end);
    const std::streamoff sz = f.tellg();
    if (sz < 0)
    {
        SetError(err, "cannot size " + path.string());
        return false;
    }

    out.resize(static_cast<std::size_t>(sz));
    f.seekg(0, std::ios::beg);
    if (sz > 0)
        f.read(out.data(), static_cast<std::streamsize>(sz));

    // Partial reads (file truncated while reading) are failures, not short files.
    if (f.gcount() != static_cast<std::streamsize>(sz))
    {
        out.clear();
        SetError(err, "short read on " + path.string());
        return false;
    }

    StripUtf8Bom(out);
    return true;
}

bool write_atomic(const fs::path& final_path, const std::string& bytes, std::string* err)
{
    std::error_code ec;
    if (final_path.has_parent_path())
    {
        fs::create_directories(final_path.parent_path(), ec);
        if (ec)
        {
            SetError(err, "create_directories failed for " + final_path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    fs::path tmp = final_path;
    tmp += ".tmp";

    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f)
        {
            SetError(err, "cannot open " + tmp.string());
            return false;
        }
        f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        f.flush();
        if (!f)
        {
            SetError(err, "write failed for " + tmp.string());
            f.close();
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, final_path, ec);
    if (ec)
    {
        SetError(err, "rename to " + final_path.string() + " failed: " + ec.message());
        std::error_code rec;
        fs::remove(tmp, rec);
        return false;
    }
    return true;
}

} // namespace reactions::io
