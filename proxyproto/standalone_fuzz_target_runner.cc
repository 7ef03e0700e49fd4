#include <fstream>
#include <iostream>
#include <stdexcept>
#include <sys/stat.h>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size);
extern "C" __attribute__((weak)) int LLVMFuzzerInitialize(int* argc, char*** argv);

/* replays corpus files through the fuzzing target, without libFuzzer */
int main(int argc, char** argv)
{
  std::cerr << "StandaloneFuzzTargetMain: running " << (argc - 1) << " inputs" << std::endl;

  if (LLVMFuzzerInitialize != nullptr) {
    LLVMFuzzerInitialize(&argc, &argv);
  }

  for (int idx = 1; idx < argc; idx++) {
    const std::string path(argv[idx]); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    struct stat st{};
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
      std::cerr << "Skipping non-regular file: " << path << std::endl;
      continue;
    }

    std::cerr << "Running: " << path << std::endl;

    std::ifstream file(path, std::ios::binary);
    std::vector<char> buffer(static_cast<size_t>(st.st_size));
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));

    if (file.fail()) {
      throw std::runtime_error("Error reading fuzzing input from file '" + path + "'");
    }

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    LLVMFuzzerTestOneInput(reinterpret_cast<const uint8_t*>(buffer.data()), buffer.size());

    std::cerr << "Done: '" << path << "': (" << buffer.size() << " bytes)" << std::endl;
  }

  return 0;
}
