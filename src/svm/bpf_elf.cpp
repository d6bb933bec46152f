#include "common/logging.h"
#include "svm/bpf_runtime.h"
#include "svm/bpf_vm.h"

namespace periwinkle {
namespace svm {

namespace {

constexpr size_t ELF64_HEADER_SIZE = 64;
constexpr size_t SECTION_HEADER_SIZE = 64;
constexpr size_t RELOCATION_SIZE = 16;
constexpr size_t SYMBOL_SIZE = 24;

constexpr uint32_t SHT_SYMTAB = 2;
constexpr uint32_t SHT_REL = 9;
constexpr uint32_t SHT_DYNSYM = 11;

constexpr uint32_t R_BPF_64_64 = 1;
constexpr uint32_t R_BPF_64_RELATIVE = 8;
constexpr uint32_t R_BPF_64_32 = 10;

constexpr uint8_t STT_FUNC = 2;

struct SectionHeader {
  std::string name;
  uint32_t type = 0;
  uint64_t flags = 0;
  uint64_t addr = 0;
  uint64_t offset = 0;
  uint64_t size = 0;
  uint32_t link = 0;
};

struct Symbol {
  std::string name;
  uint8_t type = 0;
  uint16_t section = 0;
  uint64_t value = 0;
};

uint64_t read_u64(const std::vector<uint8_t> &bytes, size_t offset) {
  uint64_t value = 0;
  for (size_t i = 0; i < 8; ++i) {
    value |= static_cast<uint64_t>(bytes[offset + i]) << (8 * i);
  }
  return value;
}

uint32_t read_u32(const std::vector<uint8_t> &bytes, size_t offset) {
  return static_cast<uint32_t>(bytes[offset]) |
         (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
         (static_cast<uint32_t>(bytes[offset + 2]) << 16) |
         (static_cast<uint32_t>(bytes[offset + 3]) << 24);
}

uint16_t read_u16(const std::vector<uint8_t> &bytes, size_t offset) {
  return static_cast<uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
}

void write_u32(std::vector<uint8_t> &bytes, size_t offset, uint32_t value) {
  for (size_t i = 0; i < 4; ++i) {
    bytes[offset + i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

void write_u64(std::vector<uint8_t> &bytes, size_t offset, uint64_t value) {
  for (size_t i = 0; i < 8; ++i) {
    bytes[offset + i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

bool in_bounds(const std::vector<uint8_t> &bytes, uint64_t offset,
               uint64_t len) {
  return offset <= bytes.size() && len <= bytes.size() - offset;
}

std::string read_cstring(const std::vector<uint8_t> &bytes,
                         const SectionHeader &table, uint32_t offset) {
  std::string out;
  for (uint64_t i = table.offset + offset;
       i < table.offset + table.size && i < bytes.size() && bytes[i] != 0;
       ++i) {
    out.push_back(static_cast<char>(bytes[i]));
  }
  return out;
}

Result<std::vector<Symbol>> read_symbols(const std::vector<uint8_t> &image,
                                         const std::vector<SectionHeader> &sections,
                                         const SectionHeader &table) {
  if (!in_bounds(image, table.offset, table.size) ||
      table.link >= sections.size()) {
    return Result<std::vector<Symbol>>("malformed symbol table " + table.name);
  }
  const SectionHeader &strings = sections[table.link];
  std::vector<Symbol> symbols;
  for (uint64_t off = table.offset; off + SYMBOL_SIZE <= table.offset + table.size;
       off += SYMBOL_SIZE) {
    Symbol symbol;
    symbol.name = read_cstring(image, strings, read_u32(image, off));
    symbol.type = image[off + 4] & 0x0f;
    symbol.section = read_u16(image, off + 6);
    symbol.value = read_u64(image, off + 8);
    symbols.push_back(std::move(symbol));
  }
  return Result<std::vector<Symbol>>(std::move(symbols));
}

} // namespace

/**
 * Only the subset of the sBPF v1 object format produced by the platform
 * toolchain is accepted: sections must be mapped at their file offset, and
 * relocations are limited to R_BPF_64_64, R_BPF_64_RELATIVE and
 * R_BPF_64_32.
 */
Result<std::shared_ptr<BpfExecutable>>
BpfExecutable::load_elf(const std::vector<uint8_t> &image) {
  using LoadResult = Result<std::shared_ptr<BpfExecutable>>;

  if (image.size() < ELF64_HEADER_SIZE) {
    return LoadResult("ELF header truncated");
  }
  if (image[4] != 2 || image[5] != 1) {
    return LoadResult("only little-endian ELF64 objects are supported");
  }

  uint64_t e_entry = read_u64(image, 24);
  uint64_t e_shoff = read_u64(image, 40);
  uint16_t e_shentsize = read_u16(image, 58);
  uint16_t e_shnum = read_u16(image, 60);
  uint16_t e_shstrndx = read_u16(image, 62);

  if (e_shentsize != SECTION_HEADER_SIZE ||
      !in_bounds(image, e_shoff, static_cast<uint64_t>(e_shnum) * e_shentsize) ||
      e_shstrndx >= e_shnum) {
    return LoadResult("malformed section header table");
  }

  std::vector<SectionHeader> sections(e_shnum);
  std::vector<uint32_t> name_offsets(e_shnum);
  for (uint16_t i = 0; i < e_shnum; ++i) {
    size_t base = e_shoff + static_cast<size_t>(i) * e_shentsize;
    name_offsets[i] = read_u32(image, base);
    sections[i].type = read_u32(image, base + 4);
    sections[i].flags = read_u64(image, base + 8);
    sections[i].addr = read_u64(image, base + 16);
    sections[i].offset = read_u64(image, base + 24);
    sections[i].size = read_u64(image, base + 32);
    sections[i].link = read_u32(image, base + 40);
  }
  for (uint16_t i = 0; i < e_shnum; ++i) {
    sections[i].name = read_cstring(image, sections[e_shstrndx], name_offsets[i]);
  }

  const SectionHeader *text = nullptr;
  for (const auto &section : sections) {
    if (section.name == ".text") {
      text = &section;
      break;
    }
  }
  if (!text) {
    return LoadResult("ELF has no .text section");
  }
  if (!in_bounds(image, text->offset, text->size)) {
    return LoadResult(".text section out of bounds");
  }
  if (text->addr != text->offset) {
    return LoadResult(".text must be mapped at its file offset");
  }
  if (e_entry < text->addr || e_entry >= text->addr + text->size ||
      (e_entry - text->addr) % 8 != 0) {
    return LoadResult("entry point outside of .text");
  }

  auto executable = std::make_shared<BpfExecutable>();
  executable->ro_image = image;
  executable->text_vaddr = text->offset;
  executable->entry_pc = (e_entry - text->addr) / 8;
  std::vector<uint8_t> &ro = executable->ro_image;

  auto in_text = [&](uint64_t offset) {
    return offset >= text->offset && offset + 8 <= text->offset + text->size;
  };

  // Symbols defined as functions in .text are call targets
  for (const auto &section : sections) {
    if (section.type != SHT_SYMTAB && section.type != SHT_DYNSYM)
      continue;
    auto symbols = read_symbols(image, sections, section);
    if (symbols.is_err()) {
      return LoadResult(symbols.error());
    }
    for (const auto &symbol : symbols.value()) {
      if (symbol.type == STT_FUNC && symbol.value >= text->addr &&
          symbol.value < text->addr + text->size) {
        uint64_t pc = (symbol.value - text->addr) / 8;
        executable->functions.emplace(function_hash(pc), pc);
      }
    }
  }
  executable->functions.emplace(function_hash(executable->entry_pc),
                                executable->entry_pc);

  for (const auto &section : sections) {
    if (section.type != SHT_REL)
      continue;
    if (!in_bounds(image, section.offset, section.size) ||
        section.link >= sections.size()) {
      return LoadResult("malformed relocation section " + section.name);
    }
    auto symbols = read_symbols(image, sections, sections[section.link]);
    if (symbols.is_err()) {
      return LoadResult(symbols.error());
    }

    for (uint64_t off = section.offset;
         off + RELOCATION_SIZE <= section.offset + section.size;
         off += RELOCATION_SIZE) {
      uint64_t r_offset = read_u64(image, off);
      uint64_t r_info = read_u64(image, off + 8);
      uint32_t type = static_cast<uint32_t>(r_info & 0xffffffff);
      uint64_t symbol_index = r_info >> 32;

      switch (type) {
      case R_BPF_64_64: {
        if (!in_text(r_offset) || r_offset + 16 > text->offset + text->size ||
            symbol_index >= symbols.value().size()) {
          return LoadResult("invalid R_BPF_64_64 relocation");
        }
        uint64_t addend = read_u32(ro, r_offset + 4);
        uint64_t address = bpf_memory::PROGRAM_START +
                           symbols.value()[symbol_index].value + addend;
        write_u32(ro, r_offset + 4, static_cast<uint32_t>(address));
        write_u32(ro, r_offset + 12, static_cast<uint32_t>(address >> 32));
        break;
      }
      case R_BPF_64_RELATIVE: {
        if (in_text(r_offset)) {
          if (r_offset + 16 > text->offset + text->size) {
            return LoadResult("invalid R_BPF_64_RELATIVE relocation");
          }
          uint64_t address = read_u32(ro, r_offset + 4) |
                             (static_cast<uint64_t>(read_u32(ro, r_offset + 12)) << 32);
          if (address < bpf_memory::PROGRAM_START)
            address += bpf_memory::PROGRAM_START;
          write_u32(ro, r_offset + 4, static_cast<uint32_t>(address));
          write_u32(ro, r_offset + 12, static_cast<uint32_t>(address >> 32));
        } else {
          if (!in_bounds(ro, r_offset, 8)) {
            return LoadResult("invalid R_BPF_64_RELATIVE relocation");
          }
          uint64_t address = read_u64(ro, r_offset);
          if (address < bpf_memory::PROGRAM_START)
            address += bpf_memory::PROGRAM_START;
          write_u64(ro, r_offset, address);
        }
        break;
      }
      case R_BPF_64_32: {
        if (!in_text(r_offset) || symbol_index >= symbols.value().size()) {
          return LoadResult("invalid R_BPF_64_32 relocation");
        }
        const Symbol &symbol = symbols.value()[symbol_index];
        uint32_t key;
        if (symbol.type == STT_FUNC && symbol.value != 0) {
          if (symbol.value < text->addr || symbol.value >= text->addr + text->size) {
            return LoadResult("call target " + symbol.name + " outside of .text");
          }
          uint64_t pc = (symbol.value - text->addr) / 8;
          key = function_hash(pc);
          executable->functions.emplace(key, pc);
        } else {
          key = syscall_hash(symbol.name);
          if (syscall_registry().find(key) == syscall_registry().end()) {
            return LoadResult("unresolved symbol " + symbol.name);
          }
        }
        write_u32(ro, r_offset + 4, key);
        break;
      }
      default:
        return LoadResult("unsupported relocation type " + std::to_string(type));
      }
    }
  }

  executable->text.assign(ro.begin() + text->offset,
                          ro.begin() + text->offset + text->size);

  auto verified = executable->verify();
  if (verified.is_err()) {
    return LoadResult(verified.error());
  }
  LOG_DEBUG("Loaded ELF program with ", executable->instruction_count(),
            " instructions, entry pc ", executable->entry_pc);
  return LoadResult(std::move(executable));
}

} // namespace svm
} // namespace periwinkle
