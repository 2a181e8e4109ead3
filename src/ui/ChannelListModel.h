#ifndef TVDECK_CHANNELLISTMODEL_H
#define TVDECK_CHANNELLISTMODEL_H

#include "core/Channel.h"

#include <QAbstractListModel>
#include <QStyledItemDelegate>

enum ChannelRoles {
    NameRole = Qt::UserRole + 1,
    GroupRole,
    LogoUrlRole,
    StreamUrlRole
};

// ─── Channel Model ───────────────────────────────────────────────

class ChannelListModel : public QAbstractListModel {
    Q_OBJECT
public:
    explicit ChannelListModel(QObject* parent = nullptr);

    void setChannels(const ChannelList& channels);
    const ChannelList& channels() const { return m_channels; }
    Channel channelAt(int row) const;

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

private:
    ChannelList m_channels;
};

// ─── Channel Row Delegate ────────────────────────────────────────

class ChannelDelegate : public QStyledItemDelegate {
    Q_OBJECT
public:
    explicit ChannelDelegate(QObject* parent = nullptr) : QStyledItemDelegate(parent) {}

    void setActiveChannel(const QString& url) { m_activeUrl = url; }

    QSize sizeHint(const QStyleOptionViewItem& option, const QModelIndex& index) const override;
    void paint(QPainter* painter, const QStyleOptionViewItem& option, const QModelIndex& index) const override;

private:
    QString m_activeUrl;
};

#endif // TVDECK_CHANNELLISTMODEL_H
