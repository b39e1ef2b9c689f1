#include "LinuxUtil.h"

#include <algorithm>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <queue>

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>
#include <pwd.h>
#include <syslog.h>
#include <signal.h>
#include <dirent.h>
#include <utime.h>

namespace EdgeSync
{

    UnixException::UnixException(const char *who, int error_code)
        : m_Who(who), m_ErrorCode(error_code), m_MessageDone(false)
    {
        // empty
    }

    UnixException::UnixException(const std::string &who, int error_code)
        : m_Who(who), m_ErrorCode(error_code), m_MessageDone(false)
    {
        // empty
    }

    const char* UnixException::what() const noexcept(true)
    {
        if (!m_MessageDone) {
            std::ostringstream msg;
            msg << m_Who << ": (" << m_ErrorCode << ") " << strerror(m_ErrorCode);
            m_Message = msg.str();
            m_MessageDone = true;
        }
        return m_Message.c_str();
    }

    void ReadData(const std::string &file_name, Buffer &data)
    {
        // Read data in 10kb chunks.  Most device descriptor files should
        // have less than one chunk.
        const int chunk_size = 10 * 1024;
        // Limit file sizes, this is only used for small metadata files.
        const unsigned max_size = 2 * 1024 * 1024;

        data.clear();
        int fd = ::open(file_name.c_str(), O_RDONLY);
        if (fd == -1) {
            throw UnixException("ReadData: open " + file_name, errno);
        }
        for (;;) {
            unsigned mark = data.size();
            data.resize(data.size() + chunk_size);
            int n = ::read(fd, &data[mark], chunk_size);
            if (n < 0) {
                int e = errno;
                ::close(fd);
                throw UnixException("ReadData: read", e);
            }
            else if (n == 0) { // End of file
                data.resize(mark);
                break;
            }
            else {
                data.resize(mark + n);
            }
            if (data.size() > max_size) {
                ::close(fd);
                throw std::runtime_error("ReadData: file too big");
            }
        }
        ::close(fd);
    }

    void WriteData(const std::string &file_name, const Buffer &data)
    {
        PartialFile f(file_name);
        if (! data.empty())
            f.Write(&data[0], data.size());
        f.Commit();
    }

    void MakeDirectoryPath(const std::string &path)
    {
        std::vector<char> buf;
        buf.reserve(path.size() + 1);
        std::copy(path.begin(), path.end(), std::back_inserter(buf));
        buf.push_back('\0');

        char *tmp = &buf[0];
        for (char *p = strchr(tmp + 1, '/'); p; p = strchr(p + 1, '/'))
        {
            *p = '\0';
            ::mkdir(tmp, 0700);
            *p = '/';
        }
        if (::mkdir(tmp, 0700) != 0 && errno != EEXIST)
            throw UnixException("MakeDirectoryPath: mkdir " + path, errno);
    }

    void RemoveFile(const std::string &file)
    {
        if (::unlink(file.c_str()) != 0 && errno != ENOENT)
            throw UnixException("RemoveFile: unlink " + file, errno);
    }

    bool IsDirectory(const std::string &path)
    {
        struct stat buf;
        return ::stat(path.c_str(), &buf) == 0 && S_ISDIR(buf.st_mode);
    }

    bool FileExists(const std::string &path)
    {
        struct stat buf;
        return ::stat(path.c_str(), &buf) == 0 && S_ISREG(buf.st_mode);
    }

    void SetFileTime(const std::string &path, std::time_t t)
    {
        struct utimbuf tb;
        tb.actime = tb.modtime = t;
        if (::utime(path.c_str(), &tb) != 0)
            throw UnixException("SetFileTime: utime " + path, errno);
    }

    std::string JoinPath(const std::string &dir, const std::string &name)
    {
        if (dir.empty())
            return name;
        if (dir[dir.size() - 1] == '/')
            return dir + name;
        return dir + "/" + name;
    }

    std::string BaseName(const std::string &path)
    {
        auto p = path.find_last_of('/');
        if (p == std::string::npos)
            return path;
        else
            return path.substr(p + 1);
    }

    std::string DirName(const std::string &path)
    {
        auto p = path.find_last_of('/');
        if (p == std::string::npos)
            return ".";
        if (p == 0)
            return "/";
        return path.substr(0, p);
    }

    std::string GetUserDataDir()
    {
        const char *home = getenv("HOME");
        if (! home) {
            struct passwd *pw = getpwuid(getuid());
            if (pw)
                home = pw->pw_dir;
        }
        if (! home) {
            throw std::runtime_error("Cannot find suitable home directory");
        }
        return std::string(home);
    }

    bool AquirePidLock(const char *pid_file_name)
    {
        char buf[32];

        // NOTE: the flag combination below will ensure that open() succedes
        // only if the PID file does not exist (and the file is created).
        int fd = open(pid_file_name, O_WRONLY | O_CREAT | O_EXCL, 0444);
        if (fd != -1)
        {
            int n = snprintf(buf, sizeof(buf), "%d", getpid());
            if (n > (int)sizeof(buf) || n < 0) {
                close(fd);
                throw std::runtime_error("AquirePidLock: snprintf failed");
            }
            int r = write(fd, buf, strlen(buf));
            if (r == -1) {
                int e = errno;
                close(fd);
                throw UnixException("AquirePidLock: write", e);
            }
            close(fd);
            return true;
        }
        else
        {
            // There is a PID file, check if the PID still exists.
            int fd = open(pid_file_name, O_RDONLY, 0);
            if (fd == -1)
                throw UnixException("AquirePidLock: open", errno);
            int n = read(fd, buf, sizeof(buf) - 1);
            int e = errno;          // in case we need it
            close(fd);
            if (n == -1)
                throw UnixException("AquirePidLock: read", e);
            buf[n] = '\0';

            int other_pid = 0;
            if (sscanf(buf, "%d", &other_pid) == 1 && other_pid > 0) {
                int r = kill((pid_t)other_pid, 0);
                if (r == 0) {
                    syslog(LOG_ERR, "another process is running as PID %d", other_pid);
                    std::cerr << "another process is running as PID " << other_pid << "\n";
                    return false;
                }
            }

            // Remove the stale PID file and try again
            RemoveFile(pid_file_name);
            return AquirePidLock(pid_file_name);
        }
    }

    void ReleasePidLock(const char *pid_file_name)
    {
        RemoveFile(pid_file_name);
    }


    // ........................................................ FileInfo ....

    std::vector<FileInfo> ListDirectoryTree(const std::string &root)
    {
        std::vector<FileInfo> result;
        std::queue<std::string> delayed_dirs;   // relative to root
        delayed_dirs.push("");

        while (! delayed_dirs.empty()) {
            std::string rel = delayed_dirs.front();
            delayed_dirs.pop();
            std::string dir = rel.empty() ? root : JoinPath(root, rel);

            DIR *d = opendir(dir.c_str());
            if (! d) {
                throw UnixException("opendir " + dir, errno);
            }
            errno = 0;
            while (struct dirent *e = readdir(d)) {
                if (! strcmp(e->d_name, ".") || ! strcmp(e->d_name, ".."))
                    continue;
                std::string name = rel.empty() ? e->d_name : JoinPath(rel, e->d_name);
                struct stat buf;
                if (::stat(JoinPath(root, name).c_str(), &buf) != 0) {
                    int err = errno;
                    closedir(d);
                    throw UnixException("stat " + JoinPath(root, name), err);
                }
                if (S_ISDIR(buf.st_mode)) {
                    delayed_dirs.push(name);
                }
                else if (S_ISREG(buf.st_mode)) {
                    FileInfo f;
                    f.Path = name;
                    f.Size = buf.st_size;
                    f.Modified = buf.st_mtime;
                    result.push_back(f);
                }
                errno = 0;
            }
            int err = errno;
            closedir(d);
            if (err != 0)
                throw UnixException("readdir " + dir, err);
        }
        return result;
    }


    // ..................................................... PartialFile ....

    PartialFile::PartialFile(const std::string &file_name)
        : m_FileName(file_name),
          m_PartName(file_name + ".part"),
          m_Fd(-1),
          m_BytesWritten(0),
          m_Committed(false)
    {
        m_Fd = ::open(m_PartName.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
        if (m_Fd == -1) {
            throw UnixException("PartialFile: open " + m_PartName, errno);
        }
    }

    PartialFile::~PartialFile()
    {
        if (! m_Committed) {
            if (m_Fd != -1)
                ::close(m_Fd);
            ::unlink(m_PartName.c_str());
        }
    }

    void PartialFile::Write(const unsigned char *data, size_t size)
    {
        if (m_Fd == -1)
            throw std::logic_error("PartialFile::Write -- file is closed");

        while (size > 0) {
            ssize_t n = ::write(m_Fd, data, size);
            if (n == -1) {
                if (errno == EINTR)
                    continue;
                throw UnixException("PartialFile: write " + m_PartName, errno);
            }
            data += n;
            size -= n;
            m_BytesWritten += n;
        }
    }

    void PartialFile::Close()
    {
        if (m_Fd == -1)
            return;
        int fd = m_Fd;
        m_Fd = -1;
        if (::fsync(fd) != 0) {
            int e = errno;
            ::close(fd);
            throw UnixException("PartialFile: fsync " + m_PartName, e);
        }
        if (::close(fd) != 0)
            throw UnixException("PartialFile: close " + m_PartName, errno);
    }

    void PartialFile::Commit()
    {
        Close();
        if (::rename(m_PartName.c_str(), m_FileName.c_str()) != 0)
            throw UnixException("PartialFile: rename " + m_FileName, errno);
        m_Committed = true;
    }

    void PartialFile::Discard()
    {
        if (m_Fd != -1) {
            ::close(m_Fd);
            m_Fd = -1;
        }
        if (! m_Committed)
            RemoveFile(m_PartName);
    }

};                                      // end namespace EdgeSync
