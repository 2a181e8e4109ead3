#include "ui/ChannelListModel.h"

#include <QPainter>
#include <QPainterPath>

static const int ROW_HEIGHT = 58;

ChannelListModel::ChannelListModel(QObject* parent)
    : QAbstractListModel(parent)
{
}

void ChannelListModel::setChannels(const ChannelList& channels) {
    beginResetModel();
    m_channels = channels;
    endResetModel();
}

Channel ChannelListModel::channelAt(int row) const {
    if (row < 0 || row >= m_channels.size()) return Channel();
    return m_channels[row];
}

int ChannelListModel::rowCount(const QModelIndex& parent) const {
    if (parent.isValid()) return 0;
    return m_channels.size();
}

QVariant ChannelListModel::data(const QModelIndex& index, int role) const {
    if (!index.isValid() || index.row() < 0 || index.row() >= m_channels.size())
        return QVariant();
    const Channel& ch = m_channels[index.row()];
    switch (role) {
        case Qt::DisplayRole:
        case NameRole: return ch.name;
        case Qt::ToolTipRole: return ch.group.isEmpty() ? ch.name : ch.name + " (" + ch.group + ")";
        case GroupRole: return ch.group;
        case LogoUrlRole: return ch.logoUrl;
        case StreamUrlRole: return ch.streamUrl;
        default: return QVariant();
    }
}

QHash<int, QByteArray> ChannelListModel::roleNames() const {
    QHash<int, QByteArray> roles;
    roles[NameRole] = "channelName";
    roles[GroupRole] = "group";
    roles[LogoUrlRole] = "logoUrl";
    roles[StreamUrlRole] = "streamUrl";
    return roles;
}

QSize ChannelDelegate::sizeHint(const QStyleOptionViewItem& option, const QModelIndex&) const {
    return QSize(option.rect.width(), ROW_HEIGHT);
}

void ChannelDelegate::paint(QPainter* painter, const QStyleOptionViewItem& option, const QModelIndex& index) const {
    painter->save();
    painter->setRenderHint(QPainter::Antialiasing, true);

    QRect r = option.rect.adjusted(4, 2, -4, -2);
    QPainterPath rowPath;
    rowPath.addRoundedRect(QRectF(r), 8, 8);

    QString streamUrl = index.data(StreamUrlRole).toString();
    bool isActive = (!m_activeUrl.isEmpty() && streamUrl == m_activeUrl);
    bool isSelected = option.state & QStyle::State_Selected;
    bool isHovered = option.state & QStyle::State_MouseOver;

    if (isActive) painter->fillPath(rowPath, QColor(30, 64, 120));
    else if (isSelected) painter->fillPath(rowPath, QColor(55, 65, 110));
    else if (isHovered) painter->fillPath(rowPath, QColor(42, 46, 72));
    else painter->fillPath(rowPath, QColor(26, 28, 46));

    if (isActive) {
        painter->setPen(QPen(QColor(99, 140, 255, 160), 2));
        painter->drawPath(rowPath);
        painter->setPen(Qt::NoPen);
        painter->setBrush(QColor(34, 197, 94));
        painter->drawEllipse(r.right() - 16, r.center().y() - 4, 8, 8);
    }

    QString name = index.data(NameRole).toString();
    QString group = index.data(GroupRole).toString();

    // Initial-letter tile
    QRect tileRect(r.left() + 8, r.top() + 7, 40, r.height() - 14);
    QPainterPath tilePath;
    tilePath.addRoundedRect(QRectF(tileRect), 6, 6);
    int h = name.isEmpty() ? 200 : qAbs(name.at(0).unicode() * 47 + name.length() * 13) % 360;
    QLinearGradient grad(tileRect.topLeft(), tileRect.bottomRight());
    grad.setColorAt(0, QColor::fromHsv(h, 130, 110));
    grad.setColorAt(1, QColor::fromHsv((h + 35) % 360, 110, 85));
    painter->fillPath(tilePath, grad);
    QFont f = painter->font();
    f.setPixelSize(18);
    f.setBold(true);
    painter->setFont(f);
    painter->setPen(QColor(255, 255, 255, 230));
    painter->drawText(tileRect, Qt::AlignCenter, name.isEmpty() ? "?" : name.left(1).toUpper());

    int textLeft = tileRect.right() + 10;
    int textWidth = r.right() - textLeft - 24;

    painter->setPen(QColor(240, 243, 248));
    QFont nameFont = painter->font();
    nameFont.setPixelSize(12);
    painter->setFont(nameFont);
    QRect nameRect(textLeft, r.top() + 6, textWidth, 20);
    painter->drawText(nameRect, Qt::AlignLeft | Qt::AlignVCenter,
                      painter->fontMetrics().elidedText(name, Qt::ElideRight, nameRect.width()));

    if (!group.isEmpty()) {
        QFont groupFont = nameFont;
        groupFont.setPixelSize(10);
        groupFont.setBold(false);
        painter->setFont(groupFont);
        int groupW = painter->fontMetrics().horizontalAdvance(group);
        int pillW = qMin(groupW + 12, textWidth);
        QRect pillRect(textLeft, r.top() + 30, pillW, 16);
        QPainterPath pillPath;
        pillPath.addRoundedRect(QRectF(pillRect), 4, 4);
        painter->fillPath(pillPath, QColor(99, 102, 241, 40));
        painter->setPen(QColor(165, 170, 220));
        painter->drawText(pillRect, Qt::AlignCenter,
                          painter->fontMetrics().elidedText(group, Qt::ElideRight, pillW - 10));
    }

    painter->restore();
}
