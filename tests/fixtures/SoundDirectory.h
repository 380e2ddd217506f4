#ifndef CARILLON_TESTS_FIXTURES_SOUND_DIRECTORY_H_
#define CARILLON_TESTS_FIXTURES_SOUND_DIRECTORY_H_

#include <stdlib.h>
#include <unistd.h>

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace carillon::tests::fixtures
{

// Scratch directory of placeholder sound files, removed on destruction.
// Contents are never decoded; only existence and readability matter.
class SoundDirectory
{
public:
  SoundDirectory()
  {
    char pattern[] = "/tmp/carillon_sounds_XXXXXX";
    const char* dir = mkdtemp(pattern);
    if (dir == nullptr)
    {
      throw std::runtime_error("mkdtemp failed");
    }
    path_ = dir;
  }

  ~SoundDirectory()
  {
    for (const auto& file : files_)
    {
      unlink(file.c_str());
    }
    rmdir(path_.c_str());
  }

  SoundDirectory(const SoundDirectory&) = delete;
  SoundDirectory& operator=(const SoundDirectory&) = delete;

  std::string Add(const std::string& file_name)
  {
    const std::string full = path_ + "/" + file_name;
    std::ofstream out(full);
    out << "placeholder";
    files_.push_back(full);
    return full;
  }

  void AddStrikeSet(const std::string& prefix = "Strike", const std::string& ext = ".mp3")
  {
    for (int i = 1; i <= 12; ++i)
    {
      Add(prefix + std::to_string(i) + ext);
    }
  }

  const std::string& path() const { return path_; }

private:
  std::string path_;
  std::vector<std::string> files_;
};

} // namespace carillon::tests::fixtures

#endif // CARILLON_TESTS_FIXTURES_SOUND_DIRECTORY_H_
