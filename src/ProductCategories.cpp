#include "ProductCategories.h"

#include <QList>
#include <QPair>

namespace {

using CategoryGroup = QPair<QString, QStringList>;

const QList<CategoryGroup>& taxonomy()
{
    static const QList<CategoryGroup> groups = {
        { "Cables & Connectors", {
            "Type C to Lightning", "Type C to Type C", "MicroUSB", "Type C", "Lightning Cable",
            "HDMI Cable", "USB Hub", "SATA Cable", "Power Cable Laptop", "Power Cable Desktop",
            "Ethernet Cable", "VGA Cable", "DisplayPort Cable", "USB to Ethernet Adapter",
            "Audio Aux Cable", "Thunderbolt Cable", "USB Extension Cable", "DVI Cable",
            "Coaxial Cable", "USB-C to HDMI Adapter", "Optical Audio Cable", "Magsafe Cable",
            "RCA Cable", "FireWire Cable" } },
        { "Chargers", {
            "Charger Type C", "Charger Type V8", "Charger Type Lightning", "Type C",
            "Charging Dock", "Charging Dock PD", "Car Charger", "Laptop Charger",
            "Wireless Charger", "Solar Charger", "Fast Charger USB-A", "Wall Charger Multi-Port",
            "Portable Charger Adapter", "USB-C PD Charger", "GaN Charger", "Travel Charger",
            "Desktop Charging Station", "Magnetic Charger", "Bike Charger", "Power Inverter" } },
        { "Audio Devices", {
            "Earphone 3.5mm", "Earphone Type C", "Earphone Lightning", "Speaker",
            "HeadPhone", "AirPods", "Bluetooth Speaker", "Wireless Earbuds",
            "Noise-Canceling Headphones", "Gaming Headset", "Soundbar", "Microphone",
            "Studio Monitor Speakers", "Bone Conduction Headphones", "Portable MP3 Player",
            "Karaoke Microphone", "Audio Receiver", "Over-Ear Headphones", "In-Ear Monitors" } },
        { "Peripherals", {
            "Mouse", "Keyboard", "Pendrive", "Memory Card", "MultiPlug",
            "Webcam", "External Hard Drive", "USB Flash Drive", "Card Reader",
            "Gaming Controller", "Mouse Pad", "Keyboard Wrist Rest", "Drawing Tablet",
            "USB Docking Station", "Printer", "Scanner", "Trackball Mouse",
            "Mechanical Keyboard", "Portable SSD", "Joystick" } },
        { "Mobile Accessories", {
            "Mobile Holder", "Phone Holder", "Smart Watch", "PowerBank",
            "Phone Case", "Screen Protector", "Selfie Stick", "Lens Attachment",
            "Smartwatch Bands", "Pop Socket", "Wireless Charging Pad", "Car Phone Mount",
            "Ring Light", "Phone Grip Strap", "VR Headset", "Stylus Pen", "Phone Cooling Pad",
            "Waterproof Phone Pouch", "Anti-Slip Pad" } },
        { "Phones", {
            "Android Phone", "Iphone", "Keypad Phone", "Foldable Phone",
            "Budget Smartphone", "Flagship Smartphone", "Rugged Phone", "Gaming Phone",
            "Satellite Phone", "Senior Phone", "Dual-SIM Phone", "Refurbished Phone" } },
        { "Computer Components", {
            "SDD", "HDD", "RAM", "Router", "Graphics Card", "Motherboard",
            "CPU Cooler", "Power Supply Unit", "Network Switch", "Wi-Fi Adapter",
            "Optical Drive", "CPU", "Case Fan", "Liquid Cooling System", "Thermal Paste",
            "UPS (Uninterruptible Power Supply)", "Network Extender", "Sound Card",
            "NVMe SSD", "PCIe Riser Cable", "USB Expansion Card" } },
        { "Grooming & Others", {
            "Hair Trimmer", "Beard Trimmer", "Electric Shaver", "Hair Dryer",
            "Nail Clipper Set", "Massage Gun", "Smart Scale", "Electric Toothbrush",
            "Hair Straightener", "Curling Iron", "Facial Steamer", "Manicure Kit",
            "Foot Massager", "Nose Hair Trimmer", "Epilator", "Blood Pressure Monitor",
            "Digital Thermometer", "Aromatherapy Diffuser" } }
    };
    return groups;
}

} // namespace

QStringList ProductCategories::groups()
{
    QStringList res;
    for (const auto &group : taxonomy()) {
        res.append(group.first);
    }
    return res;
}

QStringList ProductCategories::typesOf(const QString &group)
{
    for (const auto &g : taxonomy()) {
        if (g.first == group) return g.second;
    }
    return {};
}

QStringList ProductCategories::all()
{
    QStringList res;
    for (const auto &group : taxonomy()) {
        res.append(group.first);
        res.append(group.second);
    }
    res.removeDuplicates();
    return res;
}

bool ProductCategories::isValid(const QString &category)
{
    const QString trimmed = category.trimmed();
    if (trimmed.isEmpty()) return false;

    for (const auto &group : taxonomy()) {
        if (group.first == trimmed || group.second.contains(trimmed)) return true;
    }
    return false;
}
