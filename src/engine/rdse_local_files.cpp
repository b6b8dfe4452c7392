/***************************************************************************
 *   Copyright © 2021 by Andrey Afletdinov <public.irkutsk@gmail.com>      *
 *                                                                         *
 *   Part of the RDSE: Remote Desktop Session Engine                       *
 *                                                                         *
 *   This program is free software; you can redistribute it and/or modify  *
 *   it under the terms of the GNU General Public License as published by  *
 *   the Free Software Foundation; either version 3 of the License, or     *
 *   (at your option) any later version.                                   *
 *                                                                         *
 *   This program is distributed in the hope that it will be useful,       *
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
 *   GNU General Public License for more details.                          *
 *                                                                         *
 *   You should have received a copy of the GNU General Public License     *
 *   along with this program; if not, write to the                         *
 *   Free Software Foundation, Inc.,                                       *
 *   59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.             *
 ***************************************************************************/

#include <chrono>
#include <cinttypes>

#include "rdse_tools.h"
#include "rdse_application.h"
#include "rdse_local_files.h"

namespace RDSE
{
    /* LocalFileReader */
    LocalFileReader::LocalFileReader(const std::filesystem::path & file) : path(file)
    {
        std::error_code err;

        if(! std::filesystem::is_regular_file(path, err))
        {
            Application::error("%s: %s, path: `%s'", __FUNCTION__, (err ? err.message().c_str() : "not regular file"), path.c_str());
            throw file_error(NS_FuncName);
        }

        fsize = std::filesystem::file_size(path, err);
        ifs.open(path, std::ios::binary);

        if(err || ! ifs.is_open())
        {
            Application::error("%s: %s failed, path: `%s'", __FUNCTION__, "open", path.c_str());
            throw file_error(NS_FuncName);
        }
    }

    BinaryBuf LocalFileReader::read(uint64_t offset, size_t len)
    {
        if(fsize <= offset)
        {
            return BinaryBuf();
        }

        BinaryBuf buf(std::min<uint64_t>(len, fsize - offset));

        ifs.clear();
        ifs.seekg(offset);
        ifs.read(reinterpret_cast<char*>(buf.data()), buf.size());

        if(! ifs)
        {
            Application::error("%s: %s failed, path: `%s', offset: %" PRIu64, __FUNCTION__, "read", path.c_str(), offset);
            throw file_error(NS_FuncName);
        }

        return buf;
    }

    /* LocalFileWriter */
    LocalFileWriter::LocalFileWriter(const std::filesystem::path & file) : path(file)
    {
        part = path;
        part += ".part";

        fs.open(part, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);

        if(! fs.is_open())
        {
            Application::error("%s: %s failed, path: `%s'", __FUNCTION__, "open", part.c_str());
            throw file_error(NS_FuncName);
        }
    }

    LocalFileWriter::~LocalFileWriter()
    {
        if(! finished)
        {
            fs.close();
            std::error_code err;
            std::filesystem::remove(part, err);
        }
    }

    void LocalFileWriter::write(uint64_t offset, const BinaryBuf & buf)
    {
        fs.clear();
        fs.seekp(offset);
        fs.write(reinterpret_cast<const char*>(buf.data()), buf.size());

        if(! fs)
        {
            Application::error("%s: %s failed, path: `%s', offset: %" PRIu64, __FUNCTION__, "write", part.c_str(), offset);
            throw file_error(NS_FuncName);
        }
    }

    BinaryBuf LocalFileWriter::read(uint64_t offset, size_t len)
    {
        BinaryBuf buf(len);

        fs.flush();
        fs.clear();
        fs.seekg(offset);
        fs.read(reinterpret_cast<char*>(buf.data()), buf.size());

        if(fs.gcount() < 0 || static_cast<size_t>(fs.gcount()) != len)
        {
            Application::error("%s: %s failed, path: `%s', offset: %" PRIu64, __FUNCTION__, "read", part.c_str(), offset);
            throw file_error(NS_FuncName);
        }

        return buf;
    }

    void LocalFileWriter::finish(bool success)
    {
        if(finished)
        {
            return;
        }

        finished = true;
        fs.close();

        std::error_code err;

        if(success)
        {
            std::filesystem::rename(part, path, err);

            if(err)
            {
                Application::error("%s: %s failed, path: `%s', error: %s", __FUNCTION__, "rename", path.c_str(), err.message().c_str());
                throw file_error(NS_FuncName);
            }
        }
        else
        {
            std::filesystem::remove(part, err);
        }
    }

    /* LocalFileSystem */
    LocalFileSystem::LocalFileSystem(const std::filesystem::path & dir)
    {
        std::error_code err;
        root = std::filesystem::weakly_canonical(dir.empty() ? std::filesystem::current_path(err) : dir, err);

        if(err)
        {
            Application::error("%s: %s, path: `%s'", __FUNCTION__, err.message().c_str(), dir.c_str());
            throw file_error(NS_FuncName);
        }

        Application::debug(DebugType::File, "%s: root: `%s'", __FUNCTION__, root.c_str());
    }

    std::filesystem::path LocalFileSystem::resolve(const std::string & name) const
    {
        auto rel = std::filesystem::path(name).relative_path().lexically_normal();

        if(! rel.empty() && *rel.begin() == "..")
        {
            Application::error("%s: path outside root: `%s'", __FUNCTION__, name.c_str());
            throw file_error(NS_FuncName);
        }

        return root / rel;
    }

    std::unique_ptr<FileReader> LocalFileSystem::openRead(const std::string & name)
    {
        return std::make_unique<LocalFileReader>(resolve(name));
    }

    std::unique_ptr<FileWriter> LocalFileSystem::openWrite(const std::string & name, uint64_t size)
    {
        auto path = resolve(name);

        if(auto space = std::filesystem::space(path.parent_path()); space.available < size)
        {
            Application::error("%s: no space left, path: `%s', size: %" PRIu64, __FUNCTION__, path.c_str(), size);
            throw file_error(NS_FuncName);
        }

        return std::make_unique<LocalFileWriter>(path);
    }

    std::optional<std::vector<Msg::FileEntry>> LocalFileSystem::listDirectory(const std::string & name)
    {
        std::filesystem::path path;

        try
        {
            path = resolve(name);
        }
        catch(const file_error &)
        {
            return std::nullopt;
        }

        std::error_code err;
        std::vector<Msg::FileEntry> res;

        for(auto const & entry : std::filesystem::directory_iterator{path, err})
        {
            Msg::FileEntry info;
            std::error_code err2;

            info.name = entry.path().filename().native();
            info.directory = entry.is_directory(err2);

            if(! info.directory)
            {
                info.size = entry.file_size(err2);
            }

            auto mtime = entry.last_write_time(err2);

            if(! err2)
            {
                auto sctp = std::chrono::time_point_cast<std::chrono::seconds>(mtime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
                info.mtime = sctp.time_since_epoch().count();
            }

            res.emplace_back(std::move(info));
        }

        if(err)
        {
            Application::warning("%s: %s, path: `%s'", __FUNCTION__, err.message().c_str(), path.c_str());
            return std::nullopt;
        }

        return res;
    }
}
