#pragma once

namespace cbp {

// Built-in project used by --test: two RISC-V targets, a vendor -march
// extension, preprocessed assembly, a custom-built unit and pre/post-build steps.
inline const char* sample_project_xml() {
    return R"XML(<?xml version="1.0" encoding="UTF-8" standalone="yes" ?>
<CodeBlocks_project_file>
	<FileVersion major="1" minor="6" />
	<Project>
		<Option title="sample" />
		<Option compiler="riscv32-v2" />
		<Build>
			<Target title="Debug">
				<Option output="build/Debug/sample.elf" prefix_auto="1" extension_auto="0" />
				<Option object_output="build/Debug/obj/" />
				<Option type="1" />
				<Compiler>
					<Add option="-O0" />
					<Add option="-g" />
					<Add option="-DDEBUG" />
				</Compiler>
			</Target>
			<Target title="Release">
				<Option output="build/Release/sample.elf" prefix_auto="1" extension_auto="0" />
				<Option object_output="build/Release/obj/" />
				<Option type="1" />
				<Compiler>
					<Add option="-Os" />
				</Compiler>
			</Target>
		</Build>
		<Compiler>
			<Add option="-march=rv32imac_xsample" />
			<Add option="-mabi=ilp32" />
			<Add option="-mjump-tables-in-text" />
			<Add option="-Wall" />
			<Add directory="include" />
			<Add directory="drivers/include" />
		</Compiler>
		<Linker>
			<Add option="-nostartfiles" />
			<Add option="-Wl,--gc-sections" />
			<Add option="-T link.ld" />
			<Add library="m" />
			<Add library="c" />
		</Linker>
		<ExtraCommands>
			<Add before="echo Building $(PROJECT_NAME)" />
			<Add after="riscv32-elf-objcopy -O binary $(TARGET_OUTPUT_FILE) $(TARGET_OUTPUT_DIR)$(TARGET_OUTPUT_BASENAME).bin" />
		</ExtraCommands>
		<Unit filename="include/board.h" />
		<Unit filename="src/main.c" />
		<Unit filename="src/startup.S" />
		<Unit filename="drivers/uart.c" />
		<Unit filename="../common/util.c" />
		<Unit filename="src/table.c">
			<Option compiler="riscv32-v2" use="1" buildCommand="$compiler $options $includes -O3 -c $file -o $(TARGET_OBJECT_DIR)table_fast.o" />
		</Unit>
		<Unit filename="src/debug_console.c">
			<Option target="Debug" />
			<Compiler>
				<Add option="-O1" />
			</Compiler>
		</Unit>
		<Extensions />
	</Project>
</CodeBlocks_project_file>
)XML";
}

} // namespace cbp
