#include "UnitTable.hpp"

namespace Quantica {

// Abbreviation lists are ordered: the first entry of a culture is the one used
// when formatting. Cultures without an entry fall back to the resolver's
// fallback culture (en-US unless configured otherwise).

// =============================================================================
// Length Units
// =============================================================================

void UnitTable::addLengthUnits() {
    QuantityInfo& length = addQuantity(QuantityType::LENGTH);

    // Metric
    registerUnit(length, makeUnit("Meter", "Meters", 1.0,
        {{"en-US", {"m"}}, {"ru-RU", {"м"}}},
        {Prefix::NANO, Prefix::MICRO, Prefix::MILLI, Prefix::CENTI,
         Prefix::DECI, Prefix::DECA, Prefix::HECTO, Prefix::KILO}));

    // Imperial/US
    registerUnit(length, makeUnit("Foot", "Feet", 0.3048,
        {{"en-US", {"ft", "'", "′"}}, {"ru-RU", {"фут"}}, {"nb-NO", {"fot", "ft", "'", "′"}}}));
    registerUnit(length, makeUnit("Inch", "Inches", 0.0254,
        {{"en-US", {"in", "\"", "″"}}, {"ru-RU", {"дюйм"}}, {"nb-NO", {"tommer", "in", "\"", "″"}}}));
    registerUnit(length, makeUnit("Yard", "Yards", 0.9144,
        {{"en-US", {"yd"}}, {"ru-RU", {"ярд"}}}));
    registerUnit(length, makeUnit("Mile", "Miles", 1609.344,
        {{"en-US", {"mi"}}, {"ru-RU", {"миля"}}}));
    registerUnit(length, makeUnit("Mil", "Mils", 2.54e-5,
        {{"en-US", {"mil"}}, {"ru-RU", {"мил"}}}));
    registerUnit(length, makeUnit("Microinch", "Microinches", 2.54e-8,
        {{"en-US", {"µin"}}, {"ru-RU", {"микродюйм"}}}));
    registerUnit(length, makeUnit("Hand", "Hands", 0.1016,
        {{"en-US", {"h", "hh"}}}));
    registerUnit(length, makeUnit("Fathom", "Fathoms", 1.8288,
        {{"en-US", {"fathom"}}}));

    // Nautical
    registerUnit(length, makeUnit("NauticalMile", "NauticalMiles", 1852.0,
        {{"en-US", {"NM", "nmi"}}, {"ru-RU", {"мор. миля"}}}));

    // Typography
    registerUnit(length, makeUnit("PrinterPoint", "PrinterPoints", 0.0254 / 72.27,
        {{"en-US", {"pt"}}}));
    registerUnit(length, makeUnit("Twip", "Twips", 0.0254 / 1440.0, {}));

    finalizeQuantity(length, "Meter");
}

// =============================================================================
// Area Units
// =============================================================================

void UnitTable::addAreaUnits() {
    QuantityInfo& area = addQuantity(QuantityType::AREA);

    // Metric
    registerUnit(area, makeUnit("SquareMeter", "SquareMeters", 1.0,
        {{"en-US", {"m²"}}, {"ru-RU", {"м²"}}}));
    registerUnit(area, makeUnit("SquareKilometer", "SquareKilometers", 1e6,
        {{"en-US", {"km²"}}, {"ru-RU", {"км²"}}}));
    registerUnit(area, makeUnit("SquareDecimeter", "SquareDecimeters", 1e-2,
        {{"en-US", {"dm²"}}, {"ru-RU", {"дм²"}}}));
    registerUnit(area, makeUnit("SquareCentimeter", "SquareCentimeters", 1e-4,
        {{"en-US", {"cm²"}}, {"ru-RU", {"см²"}}}));
    registerUnit(area, makeUnit("SquareMillimeter", "SquareMillimeters", 1e-6,
        {{"en-US", {"mm²"}}, {"ru-RU", {"мм²"}}}));
    registerUnit(area, makeUnit("Hectare", "Hectares", 1e4,
        {{"en-US", {"ha"}}, {"ru-RU", {"га"}}}));

    // Imperial/US
    registerUnit(area, makeUnit("SquareFoot", "SquareFeet", 0.09290304,
        {{"en-US", {"ft²", "sq ft"}}, {"ru-RU", {"фут²"}}}));
    registerUnit(area, makeUnit("SquareInch", "SquareInches", 0.00064516,
        {{"en-US", {"in²", "sq in"}}, {"ru-RU", {"дюйм²"}}}));
    registerUnit(area, makeUnit("SquareYard", "SquareYards", 0.83612736,
        {{"en-US", {"yd²"}}, {"ru-RU", {"ярд²"}}}));
    registerUnit(area, makeUnit("SquareMile", "SquareMiles", 2589988.110336,
        {{"en-US", {"mi²"}}, {"ru-RU", {"миля²"}}}));
    registerUnit(area, makeUnit("Acre", "Acres", 4046.8564224,
        {{"en-US", {"ac"}}, {"ru-RU", {"акр"}}}));

    finalizeQuantity(area, "SquareMeter");
}

// =============================================================================
// Volume Units
// =============================================================================

void UnitTable::addVolumeUnits() {
    QuantityInfo& volume = addQuantity(QuantityType::VOLUME);

    // Metric
    registerUnit(volume, makeUnit("CubicMeter", "CubicMeters", 1.0,
        {{"en-US", {"m³"}}, {"ru-RU", {"м³"}}}));
    registerUnit(volume, makeUnit("CubicCentimeter", "CubicCentimeters", 1e-6,
        {{"en-US", {"cm³"}}, {"ru-RU", {"см³"}}}));
    registerUnit(volume, makeUnit("CubicMillimeter", "CubicMillimeters", 1e-9,
        {{"en-US", {"mm³"}}, {"ru-RU", {"мм³"}}}));
    registerUnit(volume, makeUnit("Liter", "Liters", 1e-3,
        {{"en-US", {"l", "L"}}, {"ru-RU", {"л"}}},
        {Prefix::MICRO, Prefix::MILLI, Prefix::CENTI, Prefix::DECI,
         Prefix::HECTO, Prefix::KILO}));

    // Imperial/US
    registerUnit(volume, makeUnit("CubicFoot", "CubicFeet", 0.028316846592,
        {{"en-US", {"ft³"}}, {"ru-RU", {"фут³"}}}));
    registerUnit(volume, makeUnit("CubicInch", "CubicInches", 1.6387064e-5,
        {{"en-US", {"in³"}}, {"ru-RU", {"дюйм³"}}}));
    registerUnit(volume, makeUnit("UsGallon", "UsGallons", 0.003785411784,
        {{"en-US", {"gal (U.S.)"}}, {"ru-RU", {"Американский галлон"}}}));
    registerUnit(volume, makeUnit("ImperialGallon", "ImperialGallons", 0.00454609,
        {{"en-US", {"gal (imp.)"}}, {"ru-RU", {"Английский галлон"}}}));

    // Oil field
    registerUnit(volume, makeUnit("OilBarrel", "OilBarrels", 0.158987294928,
        {{"en-US", {"bbl"}}}));

    finalizeQuantity(volume, "CubicMeter");
}

// =============================================================================
// Speed Units
// =============================================================================

void UnitTable::addSpeedUnits() {
    QuantityInfo& speed = addQuantity(QuantityType::SPEED);

    // Metric
    registerUnit(speed, makeUnit("MeterPerSecond", "MetersPerSecond", 1.0,
        {{"en-US", {"m/s"}}, {"ru-RU", {"м/с"}}},
        {Prefix::NANO, Prefix::MICRO, Prefix::MILLI, Prefix::CENTI,
         Prefix::DECI, Prefix::KILO}));
    registerUnit(speed, makeUnit("MeterPerMinute", "MetersPerMinute", 1.0 / 60.0,
        {{"en-US", {"m/min"}}, {"ru-RU", {"м/мин"}}}));
    registerUnit(speed, makeUnit("KilometerPerHour", "KilometersPerHour", 1.0 / 3.6,
        {{"en-US", {"km/h"}}, {"ru-RU", {"км/ч"}}}));

    // Imperial/US
    registerUnit(speed, makeUnit("FootPerSecond", "FeetPerSecond", 0.3048,
        {{"en-US", {"ft/s"}}, {"ru-RU", {"фут/с"}}}));
    registerUnit(speed, makeUnit("MilePerHour", "MilesPerHour", 0.44704,
        {{"en-US", {"mph"}}, {"ru-RU", {"миль/ч"}}}));

    // Nautical
    registerUnit(speed, makeUnit("Knot", "Knots", 1852.0 / 3600.0,
        {{"en-US", {"kn", "kt", "knot", "knots"}}, {"ru-RU", {"уз."}}}));

    finalizeQuantity(speed, "MeterPerSecond");
}

// =============================================================================
// Acceleration Units
// =============================================================================

void UnitTable::addAccelerationUnits() {
    QuantityInfo& acceleration = addQuantity(QuantityType::ACCELERATION);

    registerUnit(acceleration, makeUnit("MeterPerSecondSquared", "MetersPerSecondSquared", 1.0,
        {{"en-US", {"m/s²"}}, {"ru-RU", {"м/с²"}}},
        {Prefix::NANO, Prefix::MICRO, Prefix::MILLI, Prefix::CENTI,
         Prefix::DECI, Prefix::KILO}));
    registerUnit(acceleration, makeUnit("FootPerSecondSquared", "FeetPerSecondSquared", 0.3048,
        {{"en-US", {"ft/s²"}}, {"ru-RU", {"фут/с²"}}}));
    registerUnit(acceleration, makeUnit("KnotPerSecond", "KnotsPerSecond", 1852.0 / 3600.0,
        {{"en-US", {"kn/s"}}, {"ru-RU", {"узел/с"}}}));
    registerUnit(acceleration, makeUnit("StandardGravity", "StandardGravity", 9.80665,
        {{"en-US", {"g"}}}));

    finalizeQuantity(acceleration, "MeterPerSecondSquared");
}

// =============================================================================
// Force Units
// =============================================================================

void UnitTable::addForceUnits() {
    QuantityInfo& force = addQuantity(QuantityType::FORCE);

    registerUnit(force, makeUnit("Newton", "Newtons", 1.0,
        {{"en-US", {"N"}}, {"ru-RU", {"Н"}}},
        {Prefix::MICRO, Prefix::MILLI, Prefix::DECA, Prefix::KILO, Prefix::MEGA}));
    registerUnit(force, makeUnit("Dyn", "Dyne", 1e-5,
        {{"en-US", {"dyn"}}, {"ru-RU", {"дин"}}}));
    registerUnit(force, makeUnit("KilogramForce", "KilogramsForce", 9.80665,
        {{"en-US", {"kgf"}}, {"ru-RU", {"кгс"}}}));
    registerUnit(force, makeUnit("PoundForce", "PoundsForce", 4.4482216152605,
        {{"en-US", {"lbf"}}, {"ru-RU", {"фунт-сила"}}}));
    registerUnit(force, makeUnit("KilopoundForce", "KilopoundsForce", 4448.2216152605,
        {{"en-US", {"kipf", "kip"}}, {"ru-RU", {"кипф"}}}));
    registerUnit(force, makeUnit("Poundal", "Poundals", 0.138254954376,
        {{"en-US", {"pdl"}}, {"ru-RU", {"паундаль"}}}));

    finalizeQuantity(force, "Newton");
}

// =============================================================================
// Torque Units
// =============================================================================

void UnitTable::addTorqueUnits() {
    QuantityInfo& torque = addQuantity(QuantityType::TORQUE);

    registerUnit(torque, makeUnit("NewtonMeter", "NewtonMeters", 1.0,
        {{"en-US", {"N·m"}}, {"ru-RU", {"Н·м"}}},
        {Prefix::MICRO, Prefix::MILLI, Prefix::KILO, Prefix::MEGA}));
    registerUnit(torque, makeUnit("NewtonCentimeter", "NewtonCentimeters", 0.01,
        {{"en-US", {"N·cm"}}, {"ru-RU", {"Н·см"}}}));
    registerUnit(torque, makeUnit("KilogramForceMeter", "KilogramForceMeters", 9.80665,
        {{"en-US", {"kgf·m"}}}));
    registerUnit(torque, makeUnit("PoundForceFoot", "PoundForceFeet", 1.3558179483314,
        {{"en-US", {"lbf·ft"}}}));
    registerUnit(torque, makeUnit("PoundForceInch", "PoundForceInches", 0.112984829027617,
        {{"en-US", {"lbf·in"}}}));

    finalizeQuantity(torque, "NewtonMeter");
}

// =============================================================================
// Mass Units
// =============================================================================

void UnitTable::addMassUnits() {
    QuantityInfo& mass = addQuantity(QuantityType::MASS);

    // Metric
    registerUnit(mass, makeUnit("Gram", "Grams", 1e-3,
        {{"en-US", {"g"}}, {"ru-RU", {"г"}}},
        {Prefix::NANO, Prefix::MICRO, Prefix::MILLI, Prefix::CENTI,
         Prefix::DECI, Prefix::DECA, Prefix::HECTO, Prefix::KILO}));
    registerUnit(mass, makeUnit("Tonne", "Tonnes", 1e3,
        {{"en-US", {"t"}}, {"ru-RU", {"т"}}},
        {Prefix::KILO, Prefix::MEGA}));

    // Imperial/US
    registerUnit(mass, makeUnit("Pound", "Pounds", 0.45359237,
        {{"en-US", {"lb", "lbs", "lbm"}}, {"ru-RU", {"фунт"}}}));
    registerUnit(mass, makeUnit("Ounce", "Ounces", 0.028349523125,
        {{"en-US", {"oz"}}, {"ru-RU", {"унц"}}}));
    registerUnit(mass, makeUnit("Stone", "Stone", 6.35029318,
        {{"en-US", {"st"}}}));
    registerUnit(mass, makeUnit("Slug", "Slugs", 14.593902937206,
        {{"en-US", {"slug"}}}));

    // "ton" is shared by both tons; the short ton is declared first and wins
    registerUnit(mass, makeUnit("ShortTon", "ShortTons", 907.18474,
        {{"en-US", {"t (short)", "short tn", "ton"}}}));
    registerUnit(mass, makeUnit("LongTon", "LongTons", 1016.0469088,
        {{"en-US", {"long tn", "ton"}}}));

    finalizeQuantity(mass, "Kilogram");
}

// =============================================================================
// Duration Units
// =============================================================================

void UnitTable::addDurationUnits() {
    QuantityInfo& duration = addQuantity(QuantityType::DURATION);

    registerUnit(duration, makeUnit("Second", "Seconds", 1.0,
        {{"en-US", {"s", "sec"}}, {"ru-RU", {"с", "сек"}}},
        {Prefix::NANO, Prefix::MICRO, Prefix::MILLI}));
    registerUnit(duration, makeUnit("Minute", "Minutes", 60.0,
        {{"en-US", {"min", "m"}}, {"ru-RU", {"мин"}}}));
    registerUnit(duration, makeUnit("Hour", "Hours", 3600.0,
        {{"en-US", {"h", "hr", "hrs", "hour", "hours"}}, {"ru-RU", {"ч", "час"}},
         {"nb-NO", {"t", "time", "timer"}}, {"de-DE", {"h", "Std."}}}));
    registerUnit(duration, makeUnit("Day", "Days", 86400.0,
        {{"en-US", {"d", "day", "days"}}, {"ru-RU", {"сут", "д"}},
         {"nb-NO", {"d", "døgn"}}, {"de-DE", {"d", "Tag", "Tage"}}}));
    registerUnit(duration, makeUnit("Week", "Weeks", 604800.0,
        {{"en-US", {"wk", "week", "weeks"}}, {"ru-RU", {"нед"}}}));
    registerUnit(duration, makeUnit("Month30", "Months30", 2592000.0,
        {{"en-US", {"mo", "month", "months"}}, {"ru-RU", {"мес"}}}));
    registerUnit(duration, makeUnit("Year365", "Years365", 31536000.0,
        {{"en-US", {"yr", "year", "years"}}, {"ru-RU", {"год"}}}));

    finalizeQuantity(duration, "Second");
}

// =============================================================================
// Kinematic Viscosity Units
// =============================================================================

void UnitTable::addKinematicViscosityUnits() {
    QuantityInfo& viscosity = addQuantity(QuantityType::KINEMATIC_VISCOSITY);

    registerUnit(viscosity, makeUnit("SquareMeterPerSecond", "SquareMetersPerSecond", 1.0,
        {{"en-US", {"m²/s"}}, {"ru-RU", {"м²/с"}}}));
    registerUnit(viscosity, makeUnit("Stokes", "Stokes", 1e-4,
        {{"en-US", {"St"}}, {"ru-RU", {"Ст"}}},
        {Prefix::NANO, Prefix::MICRO, Prefix::MILLI, Prefix::CENTI,
         Prefix::DECI, Prefix::KILO}));
    registerUnit(viscosity, makeUnit("SquareFootPerSecond", "SquareFeetPerSecond", 0.09290304,
        {{"en-US", {"ft²/s"}}}));

    finalizeQuantity(viscosity, "SquareMeterPerSecond");
}

} // namespace Quantica
