/**
 * @file 01_basic_usage.cpp
 * @brief FastXLS 基本用法示例
 *
 * 新建工作簿、写入单元格与公式、定义名称、克隆和删除工作表，
 * 最后保存为 .xls 并重新打开核对结果。
 */

#include "fastxls/FastXLS.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

#include <iostream>
#include <string>

using namespace fastxls;
using namespace fastxls::core;

int main(int argc, char** argv) {
    const std::string output = argc > 1 ? argv[1] : "basic_usage.xls";

    if (!fastxls::initialize("logs/basic_usage.log", true)) {
        std::cerr << "Failed to initialize FastXLS" << std::endl;
        return 1;
    }

    try {
        auto workbook = createWorkbook();

        // 1. 数据表与汇总表
        auto data = workbook->createSheet("Data");
        for (int row = 0; row < 5; ++row) {
            data->setCellNumber(row, 0, (row + 1) * 10.0);
        }
        data->setCellString(0, 1, "quarterly totals");

        auto summary = workbook->createSheet("Summary");
        summary->setCellFormula(0, 0, "SUM(Data!A1:A5)");
        summary->setCellFormula(1, 0, "AVERAGE(Data!A1:A5)");
        EXAMPLE_INFO("Summary!A1 = {}", summary->getCellFormula(0, 0));

        // 2. 定义名称
        auto totals = workbook->createName();
        totals->setNameName("Totals");
        totals->setRefersToFormula("Data!$A$1:$A$5");

        // 3. 克隆后删除原数据表，引用变为 #REF!
        auto copy = workbook->cloneSheet(0);
        EXAMPLE_INFO("Cloned sheet: {}", copy->getName());
        workbook->removeSheetAt(0);
        EXAMPLE_INFO("After removing 'Data': Summary!A1 = {}, Totals = {}",
                     summary->getCellFormula(0, 0), totals->getRefersToFormula());

        workbook->setActiveSheet(0);
        workbook->write(Path(output));
        EXAMPLE_INFO("Saved {} sheets to {}", workbook->getNumberOfSheets(), output);

        // 4. 重新打开核对
        auto reopened = openWorkbook(output);
        for (size_t i = 0; i < reopened->getNumberOfSheets(); ++i) {
            EXAMPLE_INFO("  sheet {}: {}", i, reopened->getSheetName(i));
        }
    } catch (const FastXLSException& e) {
        EXAMPLE_ERROR("FastXLS error: {}", e.getDetailedMessage());
        fastxls::cleanup();
        return 1;
    }

    fastxls::cleanup();
    return 0;
}
