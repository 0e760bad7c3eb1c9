#include <segeval/eval/npy_array_loader.hpp>
#include <segeval/core/logger.hpp>
#include <algorithm>
#include <bit>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace segeval::eval {

namespace {

constexpr char kMagic[] = "\x93NUMPY";
constexpr std::size_t kMagicSize = 6;
constexpr std::size_t kHeaderAlignment = 64;

struct NpyHeader {
  core::DType dtype{core::DType::Float32};
  std::size_t item_size{4};
  bool fortran_order{false};
  std::vector<std::uint64_t> shape;
};

std::optional<core::DType> parse_descr(std::string_view descr, std::size_t& item_size) {
  if (descr.size() < 3) return std::nullopt;
  const char order = descr[0];
  const std::string_view type = descr.substr(1);
  const bool little = order == '<' || (order == '=' && std::endian::native == std::endian::little);
  if (order == '|') {
    if (type == "u1") { item_size = 1; return core::DType::UInt8; }
    if (type == "b1") { item_size = 1; return core::DType::Bool; }
    return std::nullopt;
  }
  if (!little) return std::nullopt;
  if (type == "f4") { item_size = 4; return core::DType::Float32; }
  if (type == "f8") { item_size = 8; return core::DType::Float64; }
  if (type == "i8") { item_size = 8; return core::DType::Int64; }
  return std::nullopt;
}

/// Value following 'key': in the header dict, with leading spaces skipped.
std::optional<std::string_view> dict_value(std::string_view header, std::string_view key) {
  const std::string quoted = "'" + std::string(key) + "'";
  auto pos = header.find(quoted);
  if (pos == std::string_view::npos) return std::nullopt;
  pos = header.find(':', pos + quoted.size());
  if (pos == std::string_view::npos) return std::nullopt;
  pos = header.find_first_not_of(' ', pos + 1);
  if (pos == std::string_view::npos) return std::nullopt;
  return header.substr(pos);
}

std::optional<NpyHeader> parse_header(std::string_view header) {
  NpyHeader out;

  auto descr = dict_value(header, "descr");
  if (!descr || descr->empty() || (*descr)[0] != '\'') return std::nullopt;
  const auto descr_end = descr->find('\'', 1);
  if (descr_end == std::string_view::npos) return std::nullopt;
  auto dtype = parse_descr(descr->substr(1, descr_end - 1), out.item_size);
  if (!dtype) return std::nullopt;
  out.dtype = *dtype;

  auto fortran = dict_value(header, "fortran_order");
  if (!fortran) return std::nullopt;
  if (fortran->starts_with("True")) out.fortran_order = true;
  else if (fortran->starts_with("False")) out.fortran_order = false;
  else return std::nullopt;

  auto shape = dict_value(header, "shape");
  if (!shape || shape->empty() || (*shape)[0] != '(') return std::nullopt;
  const auto shape_end = shape->find(')');
  if (shape_end == std::string_view::npos) return std::nullopt;
  std::string_view dims = shape->substr(1, shape_end - 1);
  while (!dims.empty()) {
    const auto start = dims.find_first_not_of(", ");
    if (start == std::string_view::npos) break;
    dims.remove_prefix(start);
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(dims.data(), dims.data() + dims.size(), value);
    if (ec != std::errc{}) return std::nullopt;
    out.shape.push_back(value);
    dims.remove_prefix(static_cast<std::size_t>(ptr - dims.data()));
  }
  return out;
}

template <typename T>
void convert_values(const char* src, std::size_t count, std::vector<float>& dst) {
  for (std::size_t i = 0; i < count; ++i) {
    T v;
    std::memcpy(&v, src + i * sizeof(T), sizeof(T));
    dst[i] = static_cast<float>(v);
  }
}

std::expected<core::Tensor, core::EvalError> fail(const std::filesystem::path& path,
                                                  std::string_view reason) {
  core::logger().error("failed to load {}: {}", path.string(), reason);
  return std::unexpected(core::EvalError::ArtifactLoadFailed);
}

std::string descr_for(core::DType dtype) {
  switch (dtype) {
    case core::DType::Float64:
      return "<f8";
    case core::DType::UInt8:
      return "|u1";
    case core::DType::Float32:
    default:
      return "<f4";
  }
}

}  // namespace

std::expected<core::Tensor, core::EvalError> NpyArrayLoader::load(
    const std::filesystem::path& path) const {
  if constexpr (std::endian::native != std::endian::little) {
    return fail(path, "big-endian hosts are not supported");
  }

  std::ifstream f(path, std::ios::binary);
  if (!f) return fail(path, "cannot open file");

  char preamble[kMagicSize + 2];
  if (!f.read(preamble, sizeof(preamble)) ||
      std::memcmp(preamble, kMagic, kMagicSize) != 0) {
    return fail(path, "not an .npy file");
  }
  const auto major = static_cast<std::uint8_t>(preamble[kMagicSize]);
  std::uint32_t header_len = 0;
  if (major == 1) {
    unsigned char len[2];
    if (!f.read(reinterpret_cast<char*>(len), 2)) return fail(path, "truncated header");
    header_len = static_cast<std::uint32_t>(len[0]) | (static_cast<std::uint32_t>(len[1]) << 8);
  } else if (major == 2 || major == 3) {
    unsigned char len[4];
    if (!f.read(reinterpret_cast<char*>(len), 4)) return fail(path, "truncated header");
    header_len = static_cast<std::uint32_t>(len[0]) | (static_cast<std::uint32_t>(len[1]) << 8) |
                 (static_cast<std::uint32_t>(len[2]) << 16) | (static_cast<std::uint32_t>(len[3]) << 24);
  } else {
    return fail(path, "unsupported format version " + std::to_string(major));
  }

  std::string header_text(header_len, '\0');
  if (!f.read(header_text.data(), header_len)) return fail(path, "truncated header");
  auto header = parse_header(header_text);
  if (!header) return fail(path, "unsupported or malformed header: " + header_text);
  if (header->fortran_order) return fail(path, "fortran order is not supported");

  if (header->shape.size() != 2 && header->shape.size() != 3) {
    return fail(path, "rank " + std::to_string(header->shape.size()) + " is not supported");
  }
  // Dims become cv::Mat rows/cols, so each must fit in an int.
  for (const std::uint64_t dim : header->shape) {
    if (dim > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      return fail(path, "dimension " + std::to_string(dim) + " is out of range");
    }
  }
  core::Shape shape;
  if (header->shape.size() == 2) {
    shape = {1, static_cast<std::uint32_t>(header->shape[0]),
             static_cast<std::uint32_t>(header->shape[1])};
  } else {
    shape = {static_cast<std::uint32_t>(header->shape[0]),
             static_cast<std::uint32_t>(header->shape[1]),
             static_cast<std::uint32_t>(header->shape[2])};
  }

  const std::streamoff data_begin = f.tellg();
  f.seekg(0, std::ios::end);
  const std::streamoff data_end = f.tellg();
  f.seekg(data_begin);
  if (data_begin < 0 || data_end < data_begin || !f) {
    return fail(path, "cannot determine payload size");
  }
  const auto available = static_cast<std::uint64_t>(data_end - data_begin);

  std::uint64_t count = 1;
  for (const std::uint64_t dim : header->shape) {
    if (dim != 0 && count > std::numeric_limits<std::uint64_t>::max() / dim) {
      return fail(path, "element count overflows");
    }
    count *= dim;
  }
  if (count > available / header->item_size || count * header->item_size != available) {
    return fail(path, "payload holds " + std::to_string(available) + " bytes, header needs " +
                          std::to_string(count) + " elements of " +
                          std::to_string(header->item_size) + " bytes");
  }

  std::vector<char> raw(static_cast<std::size_t>(count * header->item_size));
  if (!f.read(raw.data(), static_cast<std::streamsize>(raw.size()))) {
    return fail(path, "truncated data");
  }

  std::vector<float> values(count);
  switch (header->dtype) {
    case core::DType::Float32:
      std::memcpy(values.data(), raw.data(), raw.size());
      break;
    case core::DType::Float64:
      convert_values<double>(raw.data(), count, values);
      break;
    case core::DType::Int64:
      convert_values<std::int64_t>(raw.data(), count, values);
      break;
    case core::DType::UInt8:
      convert_values<std::uint8_t>(raw.data(), count, values);
      break;
    case core::DType::Bool:
      for (std::size_t i = 0; i < count; ++i) values[i] = raw[i] != 0 ? 1.f : 0.f;
      break;
  }
  return core::Tensor(shape, std::move(values), header->dtype);
}

std::expected<void, core::EvalError> write_npy(const std::filesystem::path& path,
                                               const core::Tensor& tensor,
                                               core::DType dtype) {
  if (dtype != core::DType::Float32 && dtype != core::DType::Float64 &&
      dtype != core::DType::UInt8) {
    return std::unexpected(core::EvalError::InvalidConfig);
  }

  const auto& s = tensor.shape();
  std::string header = "{'descr': '" + descr_for(dtype) +
                       "', 'fortran_order': False, 'shape': (" +
                       std::to_string(s.channels) + ", " + std::to_string(s.height) +
                       ", " + std::to_string(s.width) + "), }";
  // magic + version + uint16 length + header + '\n' padded to the alignment
  const std::size_t unpadded = kMagicSize + 2 + 2 + header.size() + 1;
  const std::size_t padding = (kHeaderAlignment - unpadded % kHeaderAlignment) % kHeaderAlignment;
  header.append(padding, ' ');
  header.push_back('\n');

  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    core::logger().error("cannot open {} for writing", path.string());
    return std::unexpected(core::EvalError::WriteFailed);
  }
  f.write(kMagic, kMagicSize);
  const char version[2] = {1, 0};
  f.write(version, 2);
  const auto len = static_cast<std::uint16_t>(header.size());
  const char len_bytes[2] = {static_cast<char>(len & 0xff), static_cast<char>(len >> 8)};
  f.write(len_bytes, 2);
  f.write(header.data(), static_cast<std::streamsize>(header.size()));

  const auto values = tensor.data();
  switch (dtype) {
    case core::DType::Float64: {
      std::vector<double> out(values.begin(), values.end());
      f.write(reinterpret_cast<const char*>(out.data()),
              static_cast<std::streamsize>(out.size() * sizeof(double)));
      break;
    }
    case core::DType::UInt8: {
      std::vector<std::uint8_t> out(values.size());
      std::transform(values.begin(), values.end(), out.begin(), [](float v) {
        return static_cast<std::uint8_t>(std::clamp(std::lround(v), 0L, 255L));
      });
      f.write(reinterpret_cast<const char*>(out.data()),
              static_cast<std::streamsize>(out.size()));
      break;
    }
    default:
      f.write(reinterpret_cast<const char*>(values.data()),
              static_cast<std::streamsize>(values.size() * sizeof(float)));
      break;
  }
  if (!f) {
    core::logger().error("failed writing {}", path.string());
    return std::unexpected(core::EvalError::WriteFailed);
  }
  return {};
}

std::expected<void, core::EvalError> write_sample_triple(
    const std::filesystem::path& base_dir,
    const core::SampleKey& key,
    const core::Tensor& x,
    const core::Tensor& y,
    const core::Tensor& y_hat) {
  const std::filesystem::path dir = base_dir / std::string(core::to_string(key.split));
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    core::logger().error("cannot create {}: {}", dir.string(), ec.message());
    return std::unexpected(core::EvalError::WriteFailed);
  }

  const std::string index = std::to_string(key.index);
  if (auto r = write_npy(dir / ("x" + index + ".npy"), x); !r) return r;
  if (auto r = write_npy(dir / ("y" + index + ".npy"), y); !r) return r;
  return write_npy(dir / ("y_hat" + index + ".npy"), y_hat);
}

}  // namespace segeval::eval
