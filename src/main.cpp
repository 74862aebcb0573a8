#include "gridcalc/GridCalc.hpp"
#include <iostream>

using namespace gridcalc;

int main()
{
    // Initialize logging system
    Logger::getInstance().initialize("logs/gridcalc.log", Logger::Level::DEBUG, true);

    Workbook workbook;
    Sheet& sheet = workbook.activeSheet();

    // Fill a small table and some formulas
    sheet.setCellInput(*CellRef::parse("A1"), "10");
    sheet.setCellInput(*CellRef::parse("A2"), "20");
    sheet.setCellInput(*CellRef::parse("A3"), "30");
    sheet.setCellInput(*CellRef::parse("B1"), "=SUM(A1:A3)");
    sheet.setCellInput(*CellRef::parse("B2"), "=AVERAGE(A1:A3)");
    sheet.setCellInput(*CellRef::parse("B3"), "=IF(B1>50, \"big\", \"small\")");

    // Editing a precedent reports every changed cell
    auto result = sheet.setCellValue(*CellRef::parse("A1"), CellValue::number(100));
    std::cout << "Changed cells:";
    for (const auto& ref : result.changed_cells) {
        std::cout << " " << ref.toA1();
    }
    std::cout << std::endl;

    // A cycle is stored as an in-cell error
    sheet.setCellInput(*CellRef::parse("C1"), "=C2+1");
    sheet.setCellInput(*CellRef::parse("C2"), "=C1+1");

    // A rejected formula keeps the previous content
    auto rejected = sheet.setCellFormula(*CellRef::parse("A2"), "=1+");
    if (!rejected) {
        std::cout << "Rejected: " << rejected.error().fullMessage() << std::endl;
    }

    if (auto used = sheet.getUsedRange()) {
        for (const auto& ref : used->cells()) {
            if (!sheet.hasCellAt(ref)) {
                continue;
            }
            std::cout << ref.toA1() << "\t" << sheet.formulaBarText(ref) << "\t"
                      << sheet.getCellValue(ref)->toDisplayString() << std::endl;
        }
    }

    // Flush logs
    Logger::getInstance().flush();
    return 0;
}
