#include "svm/bpf_runtime.h"
#include "common/base58.h"
#include "common/logging.h"
#include "svm/bpf_vm.h"
#include <cstring>

namespace periwinkle {
namespace svm {

namespace {

constexpr uint8_t CLASS_LD = 0x00;
constexpr uint8_t CLASS_LDX = 0x01;
constexpr uint8_t CLASS_ST = 0x02;
constexpr uint8_t CLASS_STX = 0x03;
constexpr uint8_t CLASS_ALU32 = 0x04;
constexpr uint8_t CLASS_JMP = 0x05;
constexpr uint8_t CLASS_ALU64 = 0x07;

constexpr uint8_t SOURCE_REG = 0x08;

constexpr uint8_t OP_LDDW = 0x18;
constexpr uint8_t OP_CALL = 0x85;
constexpr uint8_t OP_CALLX = 0x8d;
constexpr uint8_t OP_EXIT = 0x95;

constexpr uint8_t ALU_NEG = 0x8;
constexpr uint8_t ALU_END = 0xd;

size_t access_size(uint8_t opcode) {
  switch (opcode & 0x18) {
  case 0x00:
    return 4;
  case 0x08:
    return 2;
  case 0x10:
    return 1;
  default:
    return 8;
  }
}

uint64_t read_le(const uint8_t *p, size_t size) {
  uint64_t value = 0;
  for (size_t i = 0; i < size; ++i) {
    value |= static_cast<uint64_t>(p[i]) << (8 * i);
  }
  return value;
}

void write_le(uint8_t *p, size_t size, uint64_t value) {
  for (size_t i = 0; i < size; ++i) {
    p[i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

uint64_t fetch(const std::vector<uint8_t> &text, uint64_t pc) {
  return read_le(text.data() + pc * 8, 8);
}

bool is_valid_opcode(uint8_t opcode) {
  uint8_t op = opcode >> 4;
  switch (opcode & 0x07) {
  case CLASS_LD:
    return opcode == OP_LDDW;
  case CLASS_LDX:
    return opcode == 0x61 || opcode == 0x69 || opcode == 0x71 || opcode == 0x79;
  case CLASS_ST:
    return opcode == 0x62 || opcode == 0x6a || opcode == 0x72 || opcode == 0x7a;
  case CLASS_STX:
    return opcode == 0x63 || opcode == 0x6b || opcode == 0x73 || opcode == 0x7b;
  case CLASS_ALU32:
  case CLASS_ALU64:
    if (op == ALU_NEG)
      return (opcode & SOURCE_REG) == 0;
    if (op == ALU_END)
      return (opcode & 0x07) == CLASS_ALU32;
    return op <= 0xc;
  case CLASS_JMP:
    if (opcode == OP_CALL || opcode == OP_CALLX || opcode == OP_EXIT)
      return true;
    return op <= 0xd && op != 0x8 && op != 0x9 && (op != 0x0 || opcode == 0x05);
  default:
    return false;
  }
}

} // namespace

uint32_t murmur3_32(const std::vector<uint8_t> &data) {
  const uint32_t c1 = 0xcc9e2d51;
  const uint32_t c2 = 0x1b873593;
  auto rotl = [](uint32_t x, int r) { return (x << r) | (x >> (32 - r)); };

  uint32_t h = 0;
  size_t blocks = data.size() / 4;
  for (size_t i = 0; i < blocks; ++i) {
    uint32_t k = static_cast<uint32_t>(read_le(data.data() + i * 4, 4));
    k *= c1;
    k = rotl(k, 15);
    k *= c2;
    h ^= k;
    h = rotl(h, 13);
    h = h * 5 + 0xe6546b64;
  }

  const uint8_t *tail = data.data() + blocks * 4;
  uint32_t k = 0;
  switch (data.size() & 3) {
  case 3:
    k ^= static_cast<uint32_t>(tail[2]) << 16;
    // fall through
  case 2:
    k ^= static_cast<uint32_t>(tail[1]) << 8;
    // fall through
  case 1:
    k ^= tail[0];
    k *= c1;
    k = rotl(k, 15);
    k *= c2;
    h ^= k;
  }

  h ^= static_cast<uint32_t>(data.size());
  h ^= h >> 16;
  h *= 0x85ebca6b;
  h ^= h >> 13;
  h *= 0xc2b2ae35;
  h ^= h >> 16;
  return h;
}

uint32_t syscall_hash(const std::string &name) {
  return murmur3_32(std::vector<uint8_t>(name.begin(), name.end()));
}

uint32_t function_hash(uint64_t pc) {
  std::vector<uint8_t> bytes(8);
  write_le(bytes.data(), 8, pc);
  return murmur3_32(bytes);
}

Result<std::shared_ptr<BpfExecutable>>
BpfExecutable::load(const std::vector<uint8_t> &image) {
  static const uint8_t ELF_MAGIC[4] = {0x7f, 'E', 'L', 'F'};
  if (image.size() >= 4 && std::memcmp(image.data(), ELF_MAGIC, 4) == 0) {
    return load_elf(image);
  }
  return load_raw(image);
}

Result<std::shared_ptr<BpfExecutable>>
BpfExecutable::load_raw(const std::vector<uint8_t> &image) {
  auto executable = std::make_shared<BpfExecutable>();
  executable->text = image;
  executable->ro_image = image;
  executable->text_vaddr = 0;
  executable->entry_pc = 0;
  executable->register_all_functions();

  auto verified = executable->verify();
  if (verified.is_err()) {
    return Result<std::shared_ptr<BpfExecutable>>(verified.error());
  }
  return Result<std::shared_ptr<BpfExecutable>>(std::move(executable));
}

void BpfExecutable::register_all_functions() {
  // Any instruction may be a call target; keys are hashes of the pc
  for (uint64_t pc = 0; pc < instruction_count(); ++pc) {
    functions.emplace(function_hash(pc), pc);
  }
}

Result<bool> BpfExecutable::verify() const {
  if (text.empty() || text.size() % 8 != 0) {
    return Result<bool>("text size " + std::to_string(text.size()) +
                        " is not a positive multiple of 8");
  }
  const uint64_t count = instruction_count();
  if (entry_pc >= count) {
    return Result<bool>("entry point outside of text");
  }

  for (uint64_t pc = 0; pc < count; ++pc) {
    uint64_t insn = fetch(text, pc);
    uint8_t opcode = insn & 0xff;
    uint8_t dst = (insn >> 8) & 0x0f;
    uint8_t src = (insn >> 12) & 0x0f;
    int16_t offset = static_cast<int16_t>((insn >> 16) & 0xffff);

    if (!is_valid_opcode(opcode)) {
      return Result<bool>("unsupported opcode 0x" +
                          hex_encode(std::vector<uint8_t>{opcode}) + " at pc " +
                          std::to_string(pc));
    }
    if (dst > 10 || src > 10) {
      return Result<bool>("invalid register at pc " + std::to_string(pc));
    }
    // r10 is the read-only frame pointer
    uint8_t cls = opcode & 0x07;
    if (dst == 10 && (cls == CLASS_ALU32 || cls == CLASS_ALU64 ||
                      cls == CLASS_LDX || opcode == OP_LDDW)) {
      return Result<bool>("write to r10 at pc " + std::to_string(pc));
    }
    if (opcode == OP_LDDW) {
      if (pc + 1 >= count || (fetch(text, pc + 1) & 0xff) != 0) {
        return Result<bool>("incomplete lddw at pc " + std::to_string(pc));
      }
      ++pc;
      continue;
    }
    if (cls == CLASS_JMP && opcode != OP_CALL && opcode != OP_CALLX &&
        opcode != OP_EXIT) {
      int64_t target = static_cast<int64_t>(pc) + 1 + offset;
      if (target < 0 || static_cast<uint64_t>(target) >= count) {
        return Result<bool>("jump out of bounds at pc " + std::to_string(pc));
      }
    }
  }
  return Result<bool>(true);
}

Result<bool> BpfLoader::prepare(ProgramEntry &program) const {
  if (program.image.empty()) {
    return Result<bool>("program image is empty");
  }
  auto executable = BpfExecutable::load(program.image);
  if (executable.is_err()) {
    return Result<bool>(executable.error());
  }
  program.compiled = std::move(executable).value();
  return Result<bool>(true);
}

InvokeOutcome BpfLoader::invoke(const ProgramEntry &program,
                                InvokeContext &context) const {
  auto executable =
      std::dynamic_pointer_cast<const BpfExecutable>(program.compiled);
  if (!executable) {
    context.log("Program is not deployed");
    return InvokeOutcome::failure(InstructionErrorKind::UNSUPPORTED_PROGRAM_ID);
  }

  // Heap beyond the first 32 KiB is charged per 32 KiB page
  const uint64_t page = 32 * 1024;
  uint64_t heap_pages = (context.compute_budget().heap_size + page - 1) / page;
  uint64_t heap_cost = heap_pages > 0
                           ? (heap_pages - 1) * context.compute_budget().heap_cost
                           : 0;
  if (!context.consume_checked(heap_cost)) {
    return InvokeOutcome::failure(
        InstructionErrorKind::COMPUTATIONAL_BUDGET_EXCEEDED);
  }

  SerializedParameters parameters = serialize_parameters(context);
  uint64_t return_value = 0;
  bool completed = false;
  VmFault fault;
  {
    BpfVirtualMachine vm(*executable, context, parameters);
    completed = vm.run(return_value);
    fault = vm.fault();
    LOG_TRACE("Executed ", vm.instructions_executed(), " instructions of ",
              program.name);
  }

  if (!completed) {
    if (context.feature_set().is_active(
            features::deplete_cu_meter_on_vm_failure())) {
      context.compute_meter().exhaust();
    }
    if (fault.error) {
      return InvokeOutcome{fault.kind, *fault.error};
    }
    context.log("Program failed to complete: " + fault.message);
    return InvokeOutcome::failure(
        InstructionErrorKind::PROGRAM_FAILED_TO_COMPLETE);
  }

  if (return_value != 0) {
    auto error = InstructionError::from_program_error_code(return_value);
    return InvokeOutcome::failure(
        error ? *error : InstructionError(InstructionErrorKind::INVALID_ERROR));
  }

  return deserialize_parameters(context, parameters);
}

BpfVirtualMachine::BpfVirtualMachine(const BpfExecutable &executable,
                                     InvokeContext &context,
                                     SerializedParameters &parameters)
    : executable_(executable), context_(context), parameters_(parameters) {
  const ComputeBudget &budget = context.compute_budget();
  stack_.assign(budget.stack_frame_size * budget.max_call_depth, 0);
  heap_.assign(budget.heap_size, 0);

  regions_.push_back(MemoryRegion{
      bpf_memory::PROGRAM_START,
      const_cast<uint8_t *>(executable.ro_image.data()),
      executable.ro_image.size(), false});
  regions_.push_back(
      MemoryRegion{bpf_memory::STACK_START, stack_.data(), stack_.size(), true});
  regions_.push_back(
      MemoryRegion{bpf_memory::HEAP_START, heap_.data(), heap_.size(), true});
  regions_.push_back(MemoryRegion{bpf_memory::INPUT_START,
                                  parameters.buffer.data(),
                                  parameters.buffer.size(), true});

  registers_[1] = bpf_memory::INPUT_START;
  registers_[10] = bpf_memory::STACK_START + budget.stack_frame_size;
  pc_ = executable.entry_pc;
}

bool BpfVirtualMachine::run(uint64_t &return_value) {
  while (!halted_) {
    if (pc_ >= executable_.instruction_count()) {
      return fail("execution ran past the end of text");
    }
    if (!consume(1)) {
      return false;
    }
    ++instructions_executed_;
    if (!step()) {
      return false;
    }
  }
  return_value = registers_[0];
  return true;
}

uint8_t *BpfVirtualMachine::translate(uint64_t vm_addr, uint64_t len,
                                      bool write) {
  for (auto &region : regions_) {
    if (vm_addr >= region.vm_addr && vm_addr - region.vm_addr <= region.len &&
        len <= region.len - (vm_addr - region.vm_addr)) {
      if (write && !region.writable) {
        fail("write to read-only memory at address " +
             std::to_string(vm_addr));
        return nullptr;
      }
      return region.host + (vm_addr - region.vm_addr);
    }
  }
  fail("access violation at address " + std::to_string(vm_addr) + " (" +
       std::to_string(len) + " bytes)");
  return nullptr;
}

bool BpfVirtualMachine::consume(uint64_t units) {
  if (!context_.consume_checked(units)) {
    return fail("compute budget exceeded",
                InstructionError(
                    InstructionErrorKind::COMPUTATIONAL_BUDGET_EXCEEDED));
  }
  return true;
}

bool BpfVirtualMachine::fail(const std::string &message) {
  fault_.message = message;
  fault_.error.reset();
  fault_.kind = FaultKind::INSTRUCTION_ERROR;
  return false;
}

bool BpfVirtualMachine::fail(const std::string &message,
                             InstructionError error) {
  fault_.message = message;
  fault_.error = error;
  fault_.kind = FaultKind::INSTRUCTION_ERROR;
  return false;
}

bool BpfVirtualMachine::fail(const std::string &message,
                             const InvokeOutcome &outcome) {
  fault_.message = message;
  fault_.error = outcome.error;
  fault_.kind = outcome.fault;
  return false;
}

bool BpfVirtualMachine::step() {
  uint64_t insn = fetch(executable_.text, pc_);
  uint8_t opcode = insn & 0xff;
  uint8_t dst = (insn >> 8) & 0x0f;
  uint8_t src = (insn >> 12) & 0x0f;
  int16_t offset = static_cast<int16_t>((insn >> 16) & 0xffff);
  int32_t imm = static_cast<int32_t>(insn >> 32);

  switch (opcode & 0x07) {
  case CLASS_LD: {
    // lddw spans two slots; the second carries the high word
    uint64_t high = fetch(executable_.text, pc_ + 1) >> 32;
    registers_[dst] = static_cast<uint32_t>(imm) | (high << 32);
    pc_ += 2;
    return true;
  }
  case CLASS_LDX:
    return execute_load_reg(opcode, dst, src, offset);
  case CLASS_ST:
    return execute_store(opcode, dst, offset, imm);
  case CLASS_STX:
    return execute_store_reg(opcode, dst, src, offset);
  case CLASS_ALU32:
    return execute_alu32(opcode, dst, src, imm);
  case CLASS_JMP:
    return execute_jump(opcode, dst, src, offset, imm);
  case CLASS_ALU64:
    return execute_alu64(opcode, dst, src, imm);
  default:
    return fail("unsupported instruction at pc " + std::to_string(pc_));
  }
}

bool BpfVirtualMachine::execute_alu64(uint8_t opcode, uint8_t dst, uint8_t src,
                                      int32_t imm) {
  uint8_t op = opcode >> 4;
  bool use_reg = (opcode & SOURCE_REG) != 0;
  uint64_t src_val = use_reg ? registers_[src]
                             : static_cast<uint64_t>(static_cast<int64_t>(imm));
  uint64_t &reg = registers_[dst];

  switch (op) {
  case 0x0: reg += src_val; break;                      // ADD
  case 0x1: reg -= src_val; break;                      // SUB
  case 0x2: reg *= src_val; break;                      // MUL
  case 0x3:                                             // DIV
    if (src_val == 0)
      return fail("division by zero at pc " + std::to_string(pc_));
    reg /= src_val;
    break;
  case 0x4: reg |= src_val; break;                      // OR
  case 0x5: reg &= src_val; break;                      // AND
  case 0x6: reg <<= (src_val & 63); break;              // LSH
  case 0x7: reg >>= (src_val & 63); break;              // RSH
  case 0x8: reg = static_cast<uint64_t>(-static_cast<int64_t>(reg)); break;  // NEG
  case 0x9:                                             // MOD
    if (src_val == 0)
      return fail("division by zero at pc " + std::to_string(pc_));
    reg %= src_val;
    break;
  case 0xa: reg ^= src_val; break;                      // XOR
  case 0xb: reg = src_val; break;                       // MOV
  case 0xc:                                             // ARSH
    reg = static_cast<uint64_t>(static_cast<int64_t>(reg) >> (src_val & 63));
    break;
  default:
    return fail("unsupported alu64 opcode at pc " + std::to_string(pc_));
  }
  pc_++;
  return true;
}

bool BpfVirtualMachine::execute_alu32(uint8_t opcode, uint8_t dst, uint8_t src,
                                      int32_t imm) {
  uint8_t op = opcode >> 4;
  bool use_reg = (opcode & SOURCE_REG) != 0;
  uint32_t src_val = use_reg ? static_cast<uint32_t>(registers_[src])
                             : static_cast<uint32_t>(imm);
  uint32_t dst_val = static_cast<uint32_t>(registers_[dst]);

  if (op == ALU_END) {
    uint64_t value = registers_[dst];
    if (use_reg) {
      // to big endian
      uint64_t swapped = 0;
      size_t bytes = static_cast<size_t>(imm) / 8;
      if (bytes != 2 && bytes != 4 && bytes != 8)
        return fail("invalid byte swap width at pc " + std::to_string(pc_));
      for (size_t i = 0; i < bytes; ++i) {
        swapped = (swapped << 8) | ((value >> (8 * i)) & 0xff);
      }
      registers_[dst] = swapped;
    } else {
      if (imm == 16)
        registers_[dst] = value & 0xffff;
      else if (imm == 32)
        registers_[dst] = value & 0xffffffff;
      else if (imm != 64)
        return fail("invalid byte swap width at pc " + std::to_string(pc_));
    }
    pc_++;
    return true;
  }

  // add, sub and mul results are sign extended; the rest zero extended
  bool sign_extend = false;
  switch (op) {
  case 0x0: dst_val += src_val; sign_extend = true; break;   // ADD
  case 0x1: dst_val -= src_val; sign_extend = true; break;   // SUB
  case 0x2: dst_val *= src_val; sign_extend = true; break;   // MUL
  case 0x3:                                                   // DIV
    if (src_val == 0)
      return fail("division by zero at pc " + std::to_string(pc_));
    dst_val /= src_val;
    break;
  case 0x4: dst_val |= src_val; break;                        // OR
  case 0x5: dst_val &= src_val; break;                        // AND
  case 0x6: dst_val <<= (src_val & 31); break;                // LSH
  case 0x7: dst_val >>= (src_val & 31); break;                // RSH
  case 0x8: dst_val = static_cast<uint32_t>(-static_cast<int32_t>(dst_val)); break;  // NEG
  case 0x9:                                                   // MOD
    if (src_val == 0)
      return fail("division by zero at pc " + std::to_string(pc_));
    dst_val %= src_val;
    break;
  case 0xa: dst_val ^= src_val; break;                        // XOR
  case 0xb: dst_val = src_val; break;                         // MOV
  case 0xc:                                                   // ARSH
    dst_val = static_cast<uint32_t>(static_cast<int32_t>(dst_val) >> (src_val & 31));
    break;
  default:
    return fail("unsupported alu32 opcode at pc " + std::to_string(pc_));
  }

  registers_[dst] = sign_extend
                        ? static_cast<uint64_t>(static_cast<int64_t>(
                              static_cast<int32_t>(dst_val)))
                        : static_cast<uint64_t>(dst_val);
  pc_++;
  return true;
}

bool BpfVirtualMachine::execute_jump(uint8_t opcode, uint8_t dst, uint8_t src,
                                     int16_t offset, int32_t imm) {
  if (opcode == OP_EXIT) {
    return exit_frame();
  }

  if (opcode == OP_CALL) {
    if (src == 1) {
      int64_t target = static_cast<int64_t>(pc_) + 1 + imm;
      if (target < 0 ||
          static_cast<uint64_t>(target) >= executable_.instruction_count()) {
        return fail("call out of bounds at pc " + std::to_string(pc_));
      }
      return call_internal(static_cast<uint64_t>(target));
    }
    auto &syscalls = syscall_registry();
    auto syscall = syscalls.find(static_cast<uint32_t>(imm));
    if (syscall != syscalls.end()) {
      return call_syscall(syscall->second);
    }
    auto function = executable_.functions.find(static_cast<uint32_t>(imm));
    if (function == executable_.functions.end()) {
      return fail("unsupported call 0x" + std::to_string(static_cast<uint32_t>(imm)) +
                  " at pc " + std::to_string(pc_));
    }
    return call_internal(function->second);
  }

  if (opcode == OP_CALLX) {
    if (imm < 0 || imm > 10)
      return fail("invalid callx register at pc " + std::to_string(pc_));
    uint64_t target = registers_[imm];
    uint64_t text_start = bpf_memory::PROGRAM_START + executable_.text_vaddr;
    if (target < text_start || (target - text_start) % 8 != 0 ||
        (target - text_start) / 8 >= executable_.instruction_count()) {
      return fail("callx to invalid address at pc " + std::to_string(pc_));
    }
    return call_internal((target - text_start) / 8);
  }

  uint8_t op = opcode >> 4;
  bool use_reg = (opcode & SOURCE_REG) != 0;
  uint64_t src_val = use_reg ? registers_[src]
                             : static_cast<uint64_t>(static_cast<int64_t>(imm));
  uint64_t dst_val = registers_[dst];
  int64_t s_src = static_cast<int64_t>(src_val);
  int64_t s_dst = static_cast<int64_t>(dst_val);

  bool should_jump = false;
  switch (op) {
  case 0x0: should_jump = true; break;                 // JA
  case 0x1: should_jump = dst_val == src_val; break;   // JEQ
  case 0x2: should_jump = dst_val > src_val; break;    // JGT
  case 0x3: should_jump = dst_val >= src_val; break;   // JGE
  case 0x4: should_jump = (dst_val & src_val) != 0; break;  // JSET
  case 0x5: should_jump = dst_val != src_val; break;   // JNE
  case 0x6: should_jump = s_dst > s_src; break;        // JSGT
  case 0x7: should_jump = s_dst >= s_src; break;       // JSGE
  case 0xa: should_jump = dst_val < src_val; break;    // JLT
  case 0xb: should_jump = dst_val <= src_val; break;   // JLE
  case 0xc: should_jump = s_dst < s_src; break;        // JSLT
  case 0xd: should_jump = s_dst <= s_src; break;       // JSLE
  default:
    return fail("unsupported jump opcode at pc " + std::to_string(pc_));
  }

  pc_ = should_jump ? pc_ + 1 + offset : pc_ + 1;
  return true;
}

bool BpfVirtualMachine::execute_load_reg(uint8_t opcode, uint8_t dst,
                                         uint8_t src, int16_t offset) {
  size_t size = access_size(opcode);
  uint8_t *host = translate(registers_[src] + offset, size, false);
  if (!host)
    return false;
  registers_[dst] = read_le(host, size);
  pc_++;
  return true;
}

bool BpfVirtualMachine::execute_store(uint8_t opcode, uint8_t dst,
                                      int16_t offset, int32_t imm) {
  size_t size = access_size(opcode);
  uint8_t *host = translate(registers_[dst] + offset, size, true);
  if (!host)
    return false;
  write_le(host, size, static_cast<uint64_t>(static_cast<int64_t>(imm)));
  pc_++;
  return true;
}

bool BpfVirtualMachine::execute_store_reg(uint8_t opcode, uint8_t dst,
                                          uint8_t src, int16_t offset) {
  size_t size = access_size(opcode);
  uint8_t *host = translate(registers_[dst] + offset, size, true);
  if (!host)
    return false;
  write_le(host, size, registers_[src]);
  pc_++;
  return true;
}

bool BpfVirtualMachine::call_internal(uint64_t target_pc) {
  const ComputeBudget &budget = context_.compute_budget();
  if (call_frames_.size() + 1 >= budget.max_call_depth) {
    return fail("call depth exceeded at pc " + std::to_string(pc_));
  }

  CallFrame frame;
  frame.return_pc = pc_ + 1;
  for (int i = 0; i < 4; ++i) {
    frame.saved[i] = registers_[6 + i];
  }
  frame.frame_pointer = registers_[10];
  call_frames_.push_back(frame);

  registers_[10] += budget.stack_frame_size;
  pc_ = target_pc;
  return true;
}

bool BpfVirtualMachine::call_syscall(const SyscallEntry &syscall) {
  uint64_t result = 0;
  if (!syscall.function(*this, registers_[1], registers_[2], registers_[3],
                        registers_[4], registers_[5], result)) {
    if (fault_.message.empty()) {
      fault_.message = "syscall " + syscall.name + " failed";
    }
    return false;
  }
  registers_[0] = result;
  pc_++;
  return true;
}

bool BpfVirtualMachine::exit_frame() {
  if (call_frames_.empty()) {
    halted_ = true;
    return true;
  }
  const CallFrame &frame = call_frames_.back();
  for (int i = 0; i < 4; ++i) {
    registers_[6 + i] = frame.saved[i];
  }
  registers_[10] = frame.frame_pointer;
  pc_ = frame.return_pc;
  call_frames_.pop_back();
  return true;
}

} // namespace svm
} // namespace periwinkle
