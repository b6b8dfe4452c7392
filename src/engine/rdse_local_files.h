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

#ifndef _RDSE_LOCAL_FILES_
#define _RDSE_LOCAL_FILES_

#include <fstream>
#include <stdexcept>
#include <filesystem>

#include "rdse_interfaces.h"

namespace RDSE
{
    struct file_error : public std::runtime_error
    {
        explicit file_error(const std::string & what) : std::runtime_error(what){}
        explicit file_error(const char* what) : std::runtime_error(what){}
    };

    class LocalFileReader : public FileReader
    {
        std::filesystem::path path;
        std::ifstream   ifs;
        uint64_t        fsize = 0;

    public:
        explicit LocalFileReader(const std::filesystem::path &);

        uint64_t        size(void) const override { return fsize; }
        BinaryBuf       read(uint64_t offset, size_t len) override;
    };

    /// writes to name.part, renamed on success
    class LocalFileWriter : public FileWriter
    {
        std::filesystem::path path;
        std::filesystem::path part;
        std::fstream    fs;
        bool            finished = false;

    public:
        explicit LocalFileWriter(const std::filesystem::path &);
        ~LocalFileWriter();

        void            write(uint64_t offset, const BinaryBuf &) override;
        BinaryBuf       read(uint64_t offset, size_t len) override;
        void            finish(bool success) override;
    };

    /// @brief: files below one root directory
    class LocalFileSystem : public FileSystem
    {
        std::filesystem::path root;

    protected:
        std::filesystem::path resolve(const std::string &) const;

    public:
        explicit LocalFileSystem(const std::filesystem::path & root);

        std::unique_ptr<FileReader> openRead(const std::string &) override;
        std::unique_ptr<FileWriter> openWrite(const std::string &, uint64_t size) override;
        std::optional<std::vector<Msg::FileEntry>> listDirectory(const std::string &) override;

        const std::filesystem::path & rootPath(void) const { return root; }
    };
}

#endif // _RDSE_LOCAL_FILES_
